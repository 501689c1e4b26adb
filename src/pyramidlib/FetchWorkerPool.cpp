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

#include "FetchWorkerPool.h"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <utility>

#include "Exception.h"
#include "log.h"

namespace {
// returns false if the sleep was interrupted by a stop request.
bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop_token)
{
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock { mutex };
    cv.wait_for(lock, stop_token, duration, [] { return false; });
    return !stop_token.stop_requested();
}
}

FetchWorkerPool::FetchWorkerPool(const TileImageSource& source, TaskQueue& tasks, ResultQueue& results, RetryPolicy retry_policy, unsigned max_zoom)
    : m_source(source)
    , m_tasks(tasks)
    , m_results(results)
    , m_retry_policy(retry_policy)
    , m_max_zoom(max_zoom)
{
    if (m_retry_policy.max_attempts == 0)
        throw Exception("The retry policy must allow at least one attempt.");
}

FetchWorkerPool::~FetchWorkerPool()
{
    requestStop();
    join();
}

void FetchWorkerPool::start(unsigned n_workers)
{
    if (n_workers == 0)
        throw Exception("At least one fetch worker is required.");
    if (!m_workers.empty())
        throw Exception("The fetch workers were already started.");

    m_workers.reserve(n_workers);
    for (unsigned i = 0; i < n_workers; ++i) {
        m_workers.emplace_back([this](std::stop_token stop_token) { work(stop_token); });
    }
    LOG_DEBUG("Started {} fetch workers", n_workers);
}

void FetchWorkerPool::requestStop()
{
    for (auto& worker : m_workers)
        worker.request_stop();
}

void FetchWorkerPool::join()
{
    for (auto& worker : m_workers) {
        if (worker.joinable())
            worker.join();
    }
    m_workers.clear();
}

unsigned FetchWorkerPool::workerCount() const
{
    return unsigned(m_workers.size());
}

tl::expected<TileImage, FetchError> FetchWorkerPool::fetchOnce(const tile::Id& tile) const
{
    try {
        return m_source.fetch(tile);
    } catch (const std::exception& e) {
        return tl::unexpected(FetchError(FetchErrorKind::SourceException, e.what()));
    }
}

FetchResult FetchWorkerPool::fetchWithRetry(const tile::Id& tile, std::stop_token stop_token) const
{
    if (!tile.is_valid() || tile.zoom_level > m_max_zoom) {
        LOG_ERROR("Rejecting {}, it is outside of the pyramid (max zoom {}).", tile::to_string(tile), m_max_zoom);
        return { tile, tl::unexpected(FetchError(FetchErrorKind::InvalidTile, tile::to_string(tile))), 0 };
    }

    FetchError last_error;
    for (unsigned attempt = 1; attempt <= m_retry_policy.max_attempts; ++attempt) {
        auto image = fetchOnce(tile);
        if (image.has_value())
            return { tile, std::move(image), attempt };

        last_error = image.error();
        LOG_WARN("Attempt {}/{} for {} failed: {}", attempt, m_retry_policy.max_attempts, tile::to_string(tile), last_error.description());
        if (attempt == m_retry_policy.max_attempts)
            break;

        if (!interruptible_sleep(m_retry_policy.backoff(attempt), stop_token))
            return { tile, tl::unexpected(FetchError(FetchErrorKind::Cancelled, last_error.description())), attempt };
    }

    LOG_ERROR("Dropping {} and its sub pyramid after {} attempts: {}", tile::to_string(tile), m_retry_policy.max_attempts, last_error.description());
    return { tile, tl::unexpected(last_error), m_retry_policy.max_attempts };
}

void FetchWorkerPool::work(std::stop_token stop_token)
{
    while (!stop_token.stop_requested()) {
        auto task = m_tasks.pop();
        if (!task)
            break;
        if (!m_results.push(fetchWithRetry(*task, stop_token)))
            break;
    }
}
