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

#ifndef PROGRESSREPORTER_H
#define PROGRESSREPORTER_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

struct ProgressSample {
    std::size_t queued_tasks = 0;
    std::size_t queued_results = 0;
    std::size_t outstanding = 0;
    std::size_t written = 0;
    std::size_t blank = 0;
    std::size_t failed = 0;
};

class ProgressReporter {
public:
    using Sampler = std::function<ProgressSample()>;

    ProgressReporter(Sampler sampler, std::chrono::milliseconds interval);

    [[nodiscard]] std::jthread startMonitoring() const; // logging stops when the returned thread is destroyed
    [[nodiscard]] static std::string statusLine(const ProgressSample& sample);

private:
    Sampler m_sampler;
    std::chrono::milliseconds m_interval;
};

#endif // PROGRESSREPORTER_H
