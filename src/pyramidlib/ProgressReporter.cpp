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

#include "ProgressReporter.h"

#include <condition_variable>
#include <mutex>
#include <utility>

#include <fmt/core.h>

#include "Exception.h"
#include "log.h"

ProgressReporter::ProgressReporter(Sampler sampler, std::chrono::milliseconds interval)
    : m_sampler(std::move(sampler))
    , m_interval(interval)
{
    if (!m_sampler)
        throw Exception("The progress reporter needs a sampler.");
    if (m_interval.count() <= 0)
        throw Exception("The progress interval must be positive.");
}

std::jthread ProgressReporter::startMonitoring() const
{
    std::jthread thread([sampler = m_sampler, interval = m_interval](std::stop_token stop_token) {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock { mutex };
        while (!cv.wait_for(lock, stop_token, interval, [] { return false; }) && !stop_token.stop_requested()) {
            LOG_INFO("{}", statusLine(sampler()));
        }
    });
    return thread;
}

std::string ProgressReporter::statusLine(const ProgressSample& sample)
{
    return fmt::format("Requests: {:>4}, Results: {:>4}, Outstanding: {}, Written: {}, Blank: {}, Failed: {}",
        sample.queued_tasks, sample.queued_results, sample.outstanding, sample.written, sample.blank, sample.failed);
}
