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

#ifndef TILESTOREWRITER_H
#define TILESTOREWRITER_H

#include <atomic>
#include <cstddef>

#include "BlankTileClassifier.h"
#include "OutstandingWorkCounter.h"
#include "TileStore.h"
#include "queues.h"

struct TileStoreWriterOptions {
    unsigned max_zoom = 20;
    std::size_t batch_size = 1000;
};

struct WriterStatistics {
    std::size_t written = 0;
    std::size_t blank = 0;
    std::size_t failed = 0;
    std::size_t batches = 0;
    std::size_t children_enqueued = 0;
};

/// The only consumer of the result queue and the only user of the store.
/// Persists non blank tiles in batched transactions and enqueues their children. Closes both
/// queues once the outstanding work counter reaches zero.
class TileStoreWriter {
public:
    TileStoreWriter(TileStore& store,
        const BlankTileClassifier& classifier,
        TaskQueue& tasks,
        ResultQueue& results,
        OutstandingWorkCounter& outstanding,
        TileStoreWriterOptions options);

    /// blocks until the result queue is closed and drained. throws on store failures, after rolling back.
    void run();

    /// handles a single result, the transaction must already be open.
    void process(FetchResult result);

    /// safe to call from other threads.
    [[nodiscard]] WriterStatistics statistics() const;

private:
    TileStore& m_store;
    const BlankTileClassifier& m_classifier;
    TaskQueue& m_tasks;
    ResultQueue& m_results;
    OutstandingWorkCounter& m_outstanding;
    const TileStoreWriterOptions m_options;

    std::size_t m_in_batch = 0;
    std::atomic<std::size_t> m_written = 0;
    std::atomic<std::size_t> m_blank = 0;
    std::atomic<std::size_t> m_failed = 0;
    std::atomic<std::size_t> m_batches = 0;
    std::atomic<std::size_t> m_children_enqueued = 0;
};

#endif // TILESTOREWRITER_H
