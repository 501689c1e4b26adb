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

#include <set>
#include <vector>

#include "catch2_helpers.h"

#include "Exception.h"
#include "TileStoreWriter.h"
#include "fakes.h"

namespace {
FetchResult success(const tile::Id& tile)
{
    return { tile, fakes::payload_for(tile), 1 };
}

std::set<tile::Id> drain(TaskQueue& queue)
{
    std::set<tile::Id> tiles;
    while (queue.size() > 0)
        tiles.insert(*queue.pop());
    return tiles;
}

struct WriterFixture {
    fakes::TileStore store;
    PayloadSizeBlankTileClassifier classifier;
    TaskQueue tasks;
    ResultQueue results { 100 };
    OutstandingWorkCounter outstanding;

    TileStoreWriter make(unsigned max_zoom, std::size_t batch_size = 1000)
    {
        return TileStoreWriter(store, classifier, tasks, results, outstanding, { max_zoom, batch_size });
    }
};
}

TEST_CASE("tile store writer processing")
{
    WriterFixture f;
    const tile::Id tile { 12, { 2234, 1420 }, tile::Scheme::SlippyMap };

    SECTION("a stored tile enqueues its four children")
    {
        auto writer = f.make(20);
        f.outstanding.add(2);
        f.store.beginTransaction();
        writer.process(success(tile));
        f.store.commit();

        const auto tms = tile.to(tile::Scheme::Tms);
        CHECK(f.store.committed().contains({ 12, 2234, 4095 - 1420 }));
        CHECK(f.store.committed().at({ tms.zoom_level, tms.coords.x, tms.coords.y }) == fakes::payload_for(tile));

        const auto children = tile.children();
        CHECK(drain(f.tasks) == std::set<tile::Id>(children.begin(), children.end()));
        CHECK(f.outstanding.count() == 1 + 4);
        CHECK(writer.statistics().written == 1);
        CHECK(writer.statistics().children_enqueued == 4);
    }

    SECTION("blank tiles are neither stored nor subdivided")
    {
        auto writer = f.make(20);
        f.outstanding.add(2);
        f.store.beginTransaction();
        writer.process({ tile, fakes::blank_payload(), 1 });
        writer.process({ tile, TileImage(), 1 });
        f.store.commit();
        CHECK(f.store.committed().empty());
        CHECK(f.tasks.size() == 0);
        CHECK(writer.statistics().blank == 2);
    }

    SECTION("failed tiles are neither stored nor subdivided")
    {
        auto writer = f.make(20);
        f.outstanding.add(2);
        f.store.beginTransaction();
        writer.process({ tile, tl::unexpected(FetchError(FetchErrorKind::Timeout)), 5 });
        f.store.commit();
        CHECK(f.store.committed().empty());
        CHECK(f.tasks.size() == 0);
        CHECK(writer.statistics().failed == 1);
        CHECK(f.outstanding.count() == 1);
    }

    SECTION("tiles at the maximum zoom level are leaves")
    {
        auto writer = f.make(12);
        f.outstanding.add(2);
        f.store.beginTransaction();
        writer.process(success(tile));
        f.store.commit();
        CHECK(f.store.committed().size() == 1);
        CHECK(f.tasks.size() == 0);
    }

    SECTION("completing the last task closes both queues")
    {
        auto writer = f.make(12);
        f.outstanding.add(1);
        f.store.beginTransaction();
        writer.process(success(tile));
        CHECK(f.outstanding.count() == 0);
        CHECK(f.tasks.closed());
        CHECK(f.results.closed());
    }

    SECTION("a subdivided tile never closes the queues")
    {
        auto writer = f.make(13);
        f.outstanding.add(1);
        f.store.beginTransaction();
        writer.process(success(tile));
        CHECK(f.outstanding.count() == 4);
        CHECK(!f.tasks.closed());
        CHECK(!f.results.closed());
    }
}

TEST_CASE("tile store writer run")
{
    WriterFixture f;

    SECTION("commits in batches and the final partial batch")
    {
        auto writer = f.make(5, 3);
        std::vector<tile::Id> tiles;
        for (unsigned x = 0; x < 8; ++x)
            tiles.push_back({ 5, { x, 0 }, tile::Scheme::SlippyMap });
        f.outstanding.add(tiles.size());
        for (const auto& t : tiles)
            f.results.push(success(t));

        writer.run();
        CHECK(f.store.committed().size() == 8);
        CHECK(f.store.commits() == 3);
        CHECK(writer.statistics().batches == 3);
        CHECK(!f.store.inTransaction());
        CHECK(f.results.closed());
    }

    SECTION("an already closed queue commits an empty transaction")
    {
        auto writer = f.make(5);
        f.results.close();
        writer.run();
        CHECK(f.store.commits() == 1);
        CHECK(writer.statistics().batches == 0);
    }

    SECTION("store failures roll back the open batch and propagate")
    {
        auto writer = f.make(5, 2);
        f.store.fail_after_puts = 3;
        f.outstanding.add(5);
        for (unsigned x = 0; x < 5; ++x)
            f.results.push(success({ 5, { x, 0 }, tile::Scheme::SlippyMap }));

        CHECK_THROWS_AS(writer.run(), Exception);
        CHECK(f.store.committed().size() == 2);
        CHECK(f.store.rollbacks() == 1);
        CHECK(!f.store.inTransaction());
    }
}
