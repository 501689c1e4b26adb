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
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "Exception.h"
#include "OutstandingWorkCounter.h"

TEST_CASE("outstanding work counter")
{
    SECTION("reports the completion of the last task")
    {
        OutstandingWorkCounter counter;
        counter.add(2);
        counter.add();
        CHECK(counter.count() == 3);
        CHECK(!counter.completeOne());
        CHECK(!counter.completeOne());
        CHECK(counter.completeOne());
        CHECK(counter.count() == 0);
    }

    SECTION("throws on underflow")
    {
        OutstandingWorkCounter counter;
        CHECK_THROWS_AS((void)counter.completeOne(), Exception);
        counter.add(1);
        CHECK(counter.completeOne());
        CHECK_THROWS_AS((void)counter.completeOne(), Exception);
        CHECK(counter.count() == 0);
    }

    SECTION("exactly one thread sees zero")
    {
        OutstandingWorkCounter counter;
        counter.add(80000);
        std::atomic<int> last_seen = 0;
        {
            std::vector<std::jthread> threads;
            for (int t = 0; t < 8; ++t) {
                threads.emplace_back([&]() {
                    for (int i = 0; i < 10000; ++i) {
                        if (counter.completeOne())
                            ++last_seen;
                    }
                });
            }
        }
        CHECK(last_seen == 1);
        CHECK(counter.count() == 0);
    }
}
