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
#include <vector>

#include "catch2_helpers.h"

#include "BaseCoverTiler.h"
#include "Exception.h"
#include "MBTilesStore.h"
#include "PyramidPipeline.h"
#include "ctb/GlobalMercator.hpp"
#include "fakes.h"

using namespace std::literals;

namespace {
PipelineConfig test_config(unsigned min_zoom, unsigned max_zoom, unsigned concurrency = 4)
{
    PipelineConfig config;
    config.min_zoom = min_zoom;
    config.max_zoom = max_zoom;
    config.concurrency = concurrency;
    config.batch_size = 7;
    config.result_queue_capacity = 5;
    config.retry_policy = { 3, 1ms, 2.0, 2ms };
    config.progress_interval = 0ms;
    return config;
}

std::vector<tile::Id> full_cover(unsigned zoom)
{
    const auto grid = ctb::GlobalMercator();
    return BaseCoverTiler(grid, grid.getExtent(), tile::Scheme::SlippyMap).generateTiles(zoom);
}

std::set<fakes::TileStore::Key> stored_keys(const fakes::TileStore& store)
{
    std::set<fakes::TileStore::Key> keys;
    for (const auto& [key, data] : store.committed())
        keys.insert(key);
    return keys;
}

// blank pattern that prunes parts of the pyramid at every level
bool sparse_blank(const tile::Id& t)
{
    return t.zoom_level > 2 && (t.coords.x + 2 * t.coords.y) % 3 == 0;
}
}

TEST_CASE("pyramid pipeline")
{
    fakes::TileImageSource source;
    fakes::TileStore store;
    const PayloadSizeBlankTileClassifier classifier;

    SECTION("a single blank base tile terminates without records")
    {
        source.is_blank = [](const tile::Id&) { return true; };
        PyramidPipeline pipeline(source, store, classifier, test_config(12, 20));
        const auto stats = pipeline.run({ { 12, { 2234, 1420 }, tile::Scheme::SlippyMap } });
        CHECK(store.committed().empty());
        CHECK(stats.base_tiles == 1);
        CHECK(stats.writer.blank == 1);
        CHECK(stats.writer.written == 0);
        CHECK(stats.outstanding_at_exit == 0);
    }

    SECTION("an empty base cover terminates immediately")
    {
        PyramidPipeline pipeline(source, store, classifier, test_config(12, 20));
        const auto stats = pipeline.run({});
        CHECK(store.committed().empty());
        CHECK(stats.outstanding_at_exit == 0);
        CHECK(source.totalCalls() == 0);
    }

    SECTION("full coverage over two levels stores base and four children per base tile")
    {
        const auto base = full_cover(3);
        REQUIRE(base.size() == 64);
        PyramidPipeline pipeline(source, store, classifier, test_config(3, 4));
        const auto stats = pipeline.run(base);
        CHECK(store.committed().size() == 5 * 64);
        CHECK(store.count(3) == 64);
        CHECK(store.count(4) == 4 * 64);
        CHECK(stats.writer.written == 5 * 64);
        CHECK(stats.writer.children_enqueued == 4 * 64);
        CHECK(stats.outstanding_at_exit == 0);
        CHECK(!store.inTransaction());
    }

    SECTION("every tile is requested exactly once and only below stored parents")
    {
        source.is_blank = sparse_blank;
        PyramidPipeline pipeline(source, store, classifier, test_config(2, 5, 8));
        pipeline.run(full_cover(2));

        const auto keys = stored_keys(store);
        for (const auto& [z, x, row] : keys) {
            const tile::Id stored { z, { x, row }, tile::Scheme::Tms };
            CHECK(source.calls(stored.to(tile::Scheme::SlippyMap)) == 1);
            if (z > 2) {
                const auto parent = stored.parent();
                CHECK(keys.contains({ parent.zoom_level, parent.coords.x, parent.coords.y }));
            }
        }
        CHECK(source.totalCalls() > keys.size());
    }

    SECTION("the result does not depend on the number of workers")
    {
        fakes::TileStore single_store;
        fakes::TileImageSource single_source;
        single_source.is_blank = sparse_blank;
        PyramidPipeline(single_source, single_store, classifier, test_config(2, 5, 1)).run(full_cover(2));

        source.is_blank = sparse_blank;
        PyramidPipeline(source, store, classifier, test_config(2, 5, 32)).run(full_cover(2));

        CHECK(!single_store.committed().empty());
        CHECK(stored_keys(single_store) == stored_keys(store));
    }

    SECTION("transient failures are retried")
    {
        source.failures = [](const tile::Id& t) { return t.zoom_level == 4 ? 2u : 0u; };
        PyramidPipeline pipeline(source, store, classifier, test_config(3, 4));
        const auto stats = pipeline.run(full_cover(3));
        CHECK(store.committed().size() == 5 * 64);
        CHECK(stats.writer.failed == 0);
        CHECK(source.calls({ 4, { 0, 0 }, tile::Scheme::SlippyMap }) == 3);
    }

    SECTION("permanently failing tiles are dropped with their sub pyramid")
    {
        const tile::Id broken { 3, { 1, 1 }, tile::Scheme::SlippyMap };
        source.failures = [broken](const tile::Id& t) { return t == broken ? UINT_MAX : 0u; };
        PyramidPipeline pipeline(source, store, classifier, test_config(3, 4));
        const auto stats = pipeline.run(full_cover(3));
        CHECK(stats.writer.failed == 1);
        CHECK(store.committed().size() == 5 * 63);
        CHECK(source.calls(broken) == 3);
        for (const auto& child : broken.children())
            CHECK(source.calls(child) == 0);
        CHECK(stats.outstanding_at_exit == 0);
    }

    SECTION("store failures abort the pipeline")
    {
        store.fail_after_puts = 20;
        PyramidPipeline pipeline(source, store, classifier, test_config(3, 8, 16));
        CHECK_THROWS_AS(pipeline.run(full_cover(3)), Exception);
        CHECK(!store.inTransaction());
        CHECK(store.rollbacks() == 1);
        CHECK(store.committed().size() % 7 == 0);
    }

    SECTION("the progress reporter may run alongside")
    {
        auto config = test_config(3, 4);
        config.progress_interval = 1ms;
        PyramidPipeline pipeline(source, store, classifier, config);
        pipeline.run(full_cover(3));
        CHECK(store.committed().size() == 5 * 64);
    }

    SECTION("invalid configurations are rejected")
    {
        CHECK_THROWS_AS(PyramidPipeline(source, store, classifier, test_config(5, 4)), Exception);
        CHECK_THROWS_AS(PyramidPipeline(source, store, classifier, test_config(5, 6, 0)), Exception);
        auto config = test_config(5, 6);
        config.result_queue_capacity = 0;
        CHECK_THROWS_AS(PyramidPipeline(source, store, classifier, config), Exception);
    }
}

TEST_CASE("pyramid pipeline writing mbtiles")
{
    const fakes::TemporaryFile file("pipeline");
    fakes::TileImageSource source;
    source.is_blank = [](const tile::Id& t) { return t.zoom_level == 2 && t.coords.x == 0; };
    const PayloadSizeBlankTileClassifier classifier;

    {
        MBTilesStore store(file.path());
        PyramidPipeline pipeline(source, store, classifier, test_config(1, 2));
        pipeline.run(full_cover(1));
    }

    const MBTilesStore store(file.path());
    // 4 tiles at zoom 1, 16 at zoom 2 minus the blank western column
    CHECK(store.tileCount(1) == 4);
    CHECK(store.tileCount(2) == 12);
    const tile::Id slippy { 2, { 1, 0 }, tile::Scheme::SlippyMap };
    CHECK(store.tile(2, 1, 3) == fakes::payload_for(slippy));
    CHECK(store.tile(2, 0, 0) == std::nullopt);
}
