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

#ifndef FETCHWORKERPOOL_H
#define FETCHWORKERPOOL_H

#include <stop_token>
#include <thread>
#include <vector>

#include "RetryPolicy.h"
#include "TileImageSource.h"
#include "queues.h"

/// Threads taking tiles from the task queue, fetching them from the source (with retries) and
/// pushing exactly one FetchResult per task into the result queue.
class FetchWorkerPool {
public:
    FetchWorkerPool(const TileImageSource& source, TaskQueue& tasks, ResultQueue& results, RetryPolicy retry_policy, unsigned max_zoom);
    ~FetchWorkerPool();

    FetchWorkerPool(const FetchWorkerPool&) = delete;
    FetchWorkerPool& operator=(const FetchWorkerPool&) = delete;

    void start(unsigned n_workers);
    // interrupts backoff sleeps. workers blocked on a queue only wake up once the queue is closed.
    void requestStop();
    void join();
    [[nodiscard]] unsigned workerCount() const;

    [[nodiscard]] FetchResult fetchWithRetry(const tile::Id& tile, std::stop_token stop_token = {}) const;

private:
    [[nodiscard]] tl::expected<TileImage, FetchError> fetchOnce(const tile::Id& tile) const;
    void work(std::stop_token stop_token);

    const TileImageSource& m_source;
    TaskQueue& m_tasks;
    ResultQueue& m_results;
    const RetryPolicy m_retry_policy;
    const unsigned m_max_zoom;
    std::vector<std::jthread> m_workers;
};

#endif // FETCHWORKERPOOL_H
