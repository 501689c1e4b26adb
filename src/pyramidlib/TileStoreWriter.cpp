/*****************************************************************************
 * Alpine Pyramid Builder
 * Copyright (C) 2024 alpinemaps.org
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *****************************************************************************/

#include "TileStoreWriter.h"

#include <exception>
#include <utility>

#include "Exception.h"
#include "log.h"

TileStoreWriter::TileStoreWriter(TileStore& store,
    const BlankTileClassifier& classifier,
    TaskQueue& tasks,
    ResultQueue& results,
    OutstandingWorkCounter& outstanding,
    TileStoreWriterOptions options)
    : m_store(store)
    , m_classifier(classifier)
    , m_tasks(tasks)
    , m_results(results)
    , m_outstanding(outstanding)
    , m_options(options)
{
    if (m_options.batch_size == 0)
        throw Exception("The batch size must be at least 1.");
}

void TileStoreWriter::run()
{
    m_store.beginTransaction();
    try {
        while (auto result = m_results.pop()) {
            process(std::move(*result));
        }
        m_store.commit();
        if (m_in_batch > 0)
            ++m_batches;
        m_in_batch = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Writing tiles failed, rolling back the current batch: {}", e.what());
        try {
            m_store.rollback();
        } catch (const std::exception& rollback_error) {
            LOG_ERROR("Rollback failed: {}", rollback_error.what());
        }
        throw;
    }
}

void TileStoreWriter::process(FetchResult result)
{
    if (result.failed()) {
        ++m_failed;
    } else if (m_classifier.isBlank(*result.image)) {
        ++m_blank;
        LOG_TRACE("{} is blank", tile::to_string(result.tile));
    } else {
        m_store.putTile(make_tile_record(result.tile, *result.image));
        ++m_written;
        if (++m_in_batch >= m_options.batch_size) {
            m_store.commit();
            m_store.beginTransaction();
            ++m_batches;
            m_in_batch = 0;
            LOG_INFO("Committed {} tiles", m_written.load());
        }

        if (result.tile.zoom_level + 1 <= m_options.max_zoom) {
            const auto children = result.tile.children();
            m_outstanding.add(children.size());
            for (const auto& child : children) {
                if (!m_tasks.push(child))
                    throw Exception(fmt::format("The task queue was closed while {} was still being subdivided.", tile::to_string(result.tile)));
            }
            m_children_enqueued += children.size();
        }
    }

    if (m_outstanding.completeOne()) {
        LOG_DEBUG("No outstanding work left, closing the queues.");
        m_tasks.close();
        m_results.close();
    }
}

WriterStatistics TileStoreWriter::statistics() const
{
    return { m_written.load(), m_blank.load(), m_failed.load(), m_batches.load(), m_children_enqueued.load() };
}
