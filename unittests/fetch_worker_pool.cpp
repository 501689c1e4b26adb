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

#include <chrono>
#include <climits>
#include <set>

#include "catch2_helpers.h"

#include "Exception.h"
#include "FetchWorkerPool.h"
#include "fakes.h"

using namespace std::literals;

namespace {
RetryPolicy fast_retries(unsigned attempts)
{
    return { attempts, 1ms, 2.0, 4ms };
}
}

TEST_CASE("fetch worker pool retries")
{
    fakes::TileImageSource source;
    TaskQueue tasks;
    ResultQueue results(10);
    const tile::Id tile { 12, { 2234, 1420 }, tile::Scheme::SlippyMap };

    SECTION("a tile failing k - 1 times is recovered with k attempts")
    {
        source.failures = [](const tile::Id&) { return 3u; };
        const FetchWorkerPool pool(source, tasks, results, fast_retries(5), 20);
        const auto result = pool.fetchWithRetry(tile);
        REQUIRE(!result.failed());
        CHECK(*result.image == fakes::payload_for(tile));
        CHECK(result.attempts == 4);
        CHECK(source.calls(tile) == 4);
    }

    SECTION("an always failing tile is dropped after the last attempt")
    {
        source.failures = [](const tile::Id&) { return UINT_MAX; };
        const FetchWorkerPool pool(source, tasks, results, fast_retries(3), 20);
        const auto result = pool.fetchWithRetry(tile);
        REQUIRE(result.failed());
        CHECK(result.image.error() == FetchErrorKind::Transport);
        CHECK(result.attempts == 3);
        CHECK(source.calls(tile) == 3);
    }

    SECTION("tiles outside of the pyramid are rejected without a request")
    {
        const FetchWorkerPool pool(source, tasks, results, fast_retries(3), 12);
        const auto too_deep = pool.fetchWithRetry(tile.children()[0]);
        REQUIRE(too_deep.failed());
        CHECK(too_deep.image.error() == FetchErrorKind::InvalidTile);

        const auto invalid = pool.fetchWithRetry({ 2, { 4, 0 }, tile::Scheme::SlippyMap });
        REQUIRE(invalid.failed());
        CHECK(invalid.image.error() == FetchErrorKind::InvalidTile);
        CHECK(source.totalCalls() == 0);
    }

    SECTION("an exception thrown by the source counts as a failed attempt")
    {
        source.throwing = [](const tile::Id&) { return 1u; };
        const FetchWorkerPool pool(source, tasks, results, fast_retries(3), 20);
        const auto result = pool.fetchWithRetry(tile);
        REQUIRE(!result.failed());
        CHECK(result.attempts == 2);
    }

    SECTION("a source that always throws yields a failed result")
    {
        source.throwing = [](const tile::Id&) { return UINT_MAX; };
        const FetchWorkerPool pool(source, tasks, results, fast_retries(2), 20);
        const auto result = pool.fetchWithRetry(tile);
        REQUIRE(result.failed());
        CHECK(result.image.error() == FetchErrorKind::SourceException);
        CHECK(result.image.error().message() == "attempt 2 threw");
        CHECK(result.attempts == 2);
    }

    SECTION("a stop request interrupts the backoff")
    {
        source.failures = [](const tile::Id&) { return UINT_MAX; };
        const FetchWorkerPool pool(source, tasks, results, { 5, 1h, 2.0, 1h }, 20);
        std::stop_source stop;
        const auto t0 = std::chrono::steady_clock::now();
        std::jthread stopper([&]() {
            std::this_thread::sleep_for(20ms);
            stop.request_stop();
        });
        const auto result = pool.fetchWithRetry(tile, stop.get_token());
        CHECK(std::chrono::steady_clock::now() - t0 < 10s);
        REQUIRE(result.failed());
        CHECK(result.image.error() == FetchErrorKind::Cancelled);
        CHECK(result.attempts == 1);
    }

    SECTION("a policy without attempts is rejected")
    {
        CHECK_THROWS_AS(FetchWorkerPool(source, tasks, results, fast_retries(0), 20), Exception);
    }
}

TEST_CASE("fetch worker pool survives a throwing source")
{
    fakes::TileImageSource source;
    source.throwing = [](const tile::Id&) { return UINT_MAX; };
    TaskQueue tasks;
    ResultQueue results(4);
    const tile::Id tile { 7, { 3, 5 }, tile::Scheme::SlippyMap };
    tasks.push(tile);

    FetchWorkerPool pool(source, tasks, results, fast_retries(2), 20);
    pool.start(2);
    const auto result = results.pop();
    REQUIRE(result);
    CHECK(result->tile == tile);
    REQUIRE(result->failed());
    CHECK(result->image.error() == FetchErrorKind::SourceException);

    tasks.close();
    pool.join();
}

TEST_CASE("fetch worker pool threads")
{
    fakes::TileImageSource source;
    TaskQueue tasks;
    ResultQueue results(4);

    std::set<tile::Id> expected;
    for (unsigned x = 0; x < 32; ++x) {
        const tile::Id t { 5, { x, 3 }, tile::Scheme::SlippyMap };
        expected.insert(t);
        tasks.push(t);
    }

    FetchWorkerPool pool(source, tasks, results, fast_retries(2), 20);
    pool.start(8);
    CHECK(pool.workerCount() == 8);
    CHECK_THROWS_AS(pool.start(1), Exception);

    std::set<tile::Id> received;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        const auto result = results.pop();
        REQUIRE(result);
        CHECK(!result->failed());
        CHECK(*result->image == fakes::payload_for(result->tile));
        received.insert(result->tile);
    }
    CHECK(received == expected);

    // idle workers wait for tasks until the queue is closed
    tasks.close();
    pool.join();
    CHECK(pool.workerCount() == 0);
    CHECK(results.size() == 0);
}
