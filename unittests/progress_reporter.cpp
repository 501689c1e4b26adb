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

#include <atomic>
#include <chrono>
#include <thread>

#include <catch2/catch.hpp>

#include "Exception.h"
#include "ProgressReporter.h"

using namespace std::literals;

TEST_CASE("progress reporter")
{
    SECTION("status line")
    {
        const ProgressSample sample { 12, 3, 40, 1000, 20, 1 };
        CHECK(ProgressReporter::statusLine(sample) == "Requests:   12, Results:    3, Outstanding: 40, Written: 1000, Blank: 20, Failed: 1");
    }

    SECTION("samples periodically until stopped")
    {
        std::atomic<int> samples = 0;
        const ProgressReporter reporter([&]() {
            ++samples;
            return ProgressSample {};
        },
            1ms);
        {
            auto monitoring_thread = reporter.startMonitoring();
            std::this_thread::sleep_for(50ms);
        }
        const int after_stop = samples;
        CHECK(after_stop > 0);
        std::this_thread::sleep_for(10ms);
        CHECK(samples == after_stop);
    }

    SECTION("stopping does not wait for the interval")
    {
        const ProgressReporter reporter([]() { return ProgressSample {}; }, 1h);
        const auto t0 = std::chrono::steady_clock::now();
        {
            auto monitoring_thread = reporter.startMonitoring();
        }
        CHECK(std::chrono::steady_clock::now() - t0 < 10s);
    }

    SECTION("invalid arguments")
    {
        CHECK_THROWS_AS(ProgressReporter(ProgressReporter::Sampler {}, 1s), Exception);
        CHECK_THROWS_AS(ProgressReporter([]() { return ProgressSample {}; }, 0ms), Exception);
    }
}
