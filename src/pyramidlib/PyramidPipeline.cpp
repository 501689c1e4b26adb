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

#include "PyramidPipeline.h"

#include <exception>
#include <utility>
#include <thread>

#include <fmt/core.h>

#include "Exception.h"
#include "FetchWorkerPool.h"
#include "OutstandingWorkCounter.h"
#include "ProgressReporter.h"
#include "log.h"
#include "queues.h"

PyramidPipeline::PyramidPipeline(const TileImageSource& source, TileStore& store, const BlankTileClassifier& classifier, PipelineConfig config)
    : m_source(source)
    , m_store(store)
    , m_classifier(classifier)
    , m_config(std::move(config))
{
    validate(m_config);
}

const PipelineConfig& PyramidPipeline::config() const
{
    return m_config;
}

void PyramidPipeline::validate(const PipelineConfig& config)
{
    if (config.max_zoom < config.min_zoom)
        throw Exception(fmt::format("The maximum zoom level ({}) must not be smaller than the minimum zoom level ({}).", config.max_zoom, config.min_zoom));
    if (config.max_zoom >= 31)
        throw Exception(fmt::format("The maximum zoom level ({}) must be smaller than 31.", config.max_zoom));
    if (config.concurrency == 0)
        throw Exception("The concurrency must be at least 1.");
    if (config.batch_size == 0)
        throw Exception("The batch size must be at least 1.");
    if (config.result_queue_capacity == 0)
        throw Exception("The result queue capacity must be at least 1.");
    if (config.retry_policy.max_attempts == 0)
        throw Exception("At least one attempt per tile is required.");
    if (config.progress_interval.count() < 0)
        throw Exception("The progress interval must not be negative.");
}

PipelineStatistics PyramidPipeline::run(const std::vector<tile::Id>& base_tiles)
{
    TaskQueue tasks;
    ResultQueue results(m_config.result_queue_capacity);
    OutstandingWorkCounter outstanding;

    TileStoreWriter writer(m_store, m_classifier, tasks, results, outstanding, { m_config.max_zoom, m_config.batch_size });
    FetchWorkerPool workers(m_source, tasks, results, m_config.retry_policy, m_config.max_zoom);

    outstanding.add(base_tiles.size());
    for (const auto& tile : base_tiles) {
        if (!tasks.push(tile))
            throw Exception(fmt::format("The task queue was closed while seeding {}.", tile::to_string(tile)));
    }
    if (base_tiles.empty()) {
        LOG_WARN("The base cover is empty, nothing to do.");
        tasks.close();
        results.close();
    }
    LOG_INFO("Seeded {} base tiles, fetching up to zoom level {} with {} workers.", base_tiles.size(), m_config.max_zoom, m_config.concurrency);

    workers.start(m_config.concurrency);

    // declared last, so it is stopped before the queues and the writer go away.
    std::jthread progress;
    if (m_config.progress_interval.count() > 0) {
        const ProgressReporter reporter(
            [&]() {
                const auto stats = writer.statistics();
                return ProgressSample { tasks.size(), results.size(), outstanding.count(), stats.written, stats.blank, stats.failed };
            },
            m_config.progress_interval);
        progress = reporter.startMonitoring();
    }

    try {
        writer.run();
    } catch (const std::exception&) {
        LOG_ERROR("Aborting the pipeline, {} tiles were still outstanding.", outstanding.count());
        workers.requestStop();
        tasks.close();
        results.close();
        workers.join();
        throw;
    }
    workers.join();
    progress = {};

    PipelineStatistics statistics { base_tiles.size(), writer.statistics(), outstanding.count() };
    LOG_INFO("Done. Written: {}, blank: {}, failed: {}, batches: {}.",
        statistics.writer.written, statistics.writer.blank, statistics.writer.failed, statistics.writer.batches);
    return statistics;
}
