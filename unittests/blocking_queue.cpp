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
#include <vector>

#include <catch2/catch.hpp>

#include "BlockingQueue.h"

using namespace std::literals;

TEST_CASE("blocking queue")
{
    SECTION("fifo")
    {
        BlockingQueue<int> queue;
        CHECK(queue.push(1));
        CHECK(queue.push(2));
        CHECK(queue.push(3));
        CHECK(queue.size() == 3);
        CHECK(queue.pop() == 1);
        CHECK(queue.pop() == 2);
        CHECK(queue.pop() == 3);
        CHECK(queue.size() == 0);
    }

    SECTION("closing drains the remaining items first")
    {
        BlockingQueue<int> queue;
        queue.push(1);
        queue.push(2);
        queue.close();
        CHECK(queue.closed());
        CHECK(!queue.push(3));
        CHECK(queue.pop() == 1);
        CHECK(queue.pop() == 2);
        CHECK(queue.pop() == std::nullopt);
        CHECK(queue.pop() == std::nullopt);
    }

    SECTION("close wakes up blocked consumers")
    {
        BlockingQueue<int> queue;
        std::atomic<int> woken = 0;
        std::vector<std::jthread> consumers;
        for (int i = 0; i < 4; ++i) {
            consumers.emplace_back([&]() {
                if (!queue.pop())
                    ++woken;
            });
        }
        std::this_thread::sleep_for(20ms);
        CHECK(woken == 0);
        queue.close();
        consumers.clear();
        CHECK(woken == 4);
    }

    SECTION("a full bounded queue blocks producers until an item is taken")
    {
        BlockingQueue<int> queue(2);
        CHECK(queue.capacity() == 2);
        queue.push(1);
        queue.push(2);

        std::atomic<bool> pushed = false;
        std::jthread producer([&]() {
            queue.push(3);
            pushed = true;
        });
        std::this_thread::sleep_for(20ms);
        CHECK(!pushed);
        CHECK(queue.size() == 2);

        CHECK(queue.pop() == 1);
        producer.join();
        CHECK(pushed);
        CHECK(queue.pop() == 2);
        CHECK(queue.pop() == 3);
    }

    SECTION("close wakes up blocked producers")
    {
        BlockingQueue<int> queue(1);
        queue.push(1);
        std::atomic<bool> push_result = true;
        std::jthread producer([&]() { push_result = queue.push(2); });
        std::this_thread::sleep_for(20ms);
        queue.close();
        producer.join();
        CHECK(!push_result);
        CHECK(queue.pop() == 1);
        CHECK(queue.pop() == std::nullopt);
    }

    SECTION("many producers and consumers")
    {
        BlockingQueue<int> queue(16);
        std::atomic<long> sum = 0;
        std::atomic<int> received = 0;
        {
            std::vector<std::jthread> consumers;
            for (int i = 0; i < 4; ++i) {
                consumers.emplace_back([&]() {
                    while (const auto item = queue.pop()) {
                        sum += *item;
                        ++received;
                    }
                });
            }
            {
                std::vector<std::jthread> producers;
                for (int p = 0; p < 4; ++p) {
                    producers.emplace_back([&]() {
                        for (int i = 1; i <= 1000; ++i)
                            queue.push(i);
                    });
                }
            }
            queue.close();
        }
        CHECK(received == 4000);
        CHECK(sum == 4 * 500500);
    }
}
