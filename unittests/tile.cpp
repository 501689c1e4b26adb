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
#include <unordered_set>

#include "catch2_helpers.h"

#include "TileStore.h"
#include "tile.h"

using tile::Scheme;

TEST_CASE("tile::Id scheme conversion")
{
    SECTION("slippy map -> tms")
    {
        CHECK(tile::Id { 0, { 0, 0 }, Scheme::SlippyMap }.to(Scheme::Tms) == tile::Id { 0, { 0, 0 }, Scheme::Tms });
        CHECK(tile::Id { 1, { 0, 0 }, Scheme::SlippyMap }.to(Scheme::Tms) == tile::Id { 1, { 0, 1 }, Scheme::Tms });
        CHECK(tile::Id { 2, { 3, 1 }, Scheme::SlippyMap }.to(Scheme::Tms) == tile::Id { 2, { 3, 2 }, Scheme::Tms });
        CHECK(tile::Id { 12, { 2200, 1400 }, Scheme::SlippyMap }.to(Scheme::Tms) == tile::Id { 12, { 2200, 2695 }, Scheme::Tms });
    }
    SECTION("no op for the same scheme")
    {
        CHECK(tile::Id { 2, { 2, 3 }, Scheme::Tms }.to(Scheme::Tms) == tile::Id { 2, { 2, 3 }, Scheme::Tms });
        CHECK(tile::Id { 2, { 2, 3 }, Scheme::SlippyMap }.to(Scheme::SlippyMap) == tile::Id { 2, { 2, 3 }, Scheme::SlippyMap });
    }
    SECTION("row flipping is its own inverse")
    {
        for (unsigned z = 0; z < 10; ++z) {
            for (unsigned y = 0; y < (1u << z); ++y) {
                const tile::Id slippy { z, { 0, y }, Scheme::SlippyMap };
                const auto record = make_tile_record(slippy, {});
                REQUIRE(record.row == (1u << z) - 1 - y);
                REQUIRE(tile::Id { z, { 0, record.row }, Scheme::Tms }.to(Scheme::SlippyMap) == slippy);
            }
        }
    }
}

TEST_CASE("tile::Id parent")
{
    CHECK(tile::Id { 1, { 0, 1 } }.parent() == tile::Id { 0, { 0, 0 } });
    CHECK(tile::Id { 2, { 2, 1 } }.parent() == tile::Id { 1, { 1, 0 } });
    CHECK(tile::Id { 2, { 3, 3 } }.parent() == tile::Id { 1, { 1, 1 } });
}

TEST_CASE("tile::Id children")
{
    SECTION("slippy map (y points down)")
    {
        const auto tiles = tile::Id { 1, { 1, 0 }, Scheme::SlippyMap }.children();
        for (const auto& tid : tiles) {
            CHECK(tid.zoom_level == 2);
            CHECK(tid.scheme == Scheme::SlippyMap);
        }
        CHECK(tiles[0].coords == glm::uvec2 { 2, 1 });
        CHECK(tiles[1].coords == glm::uvec2 { 3, 1 });
        CHECK(tiles[2].coords == glm::uvec2 { 2, 0 });
        CHECK(tiles[3].coords == glm::uvec2 { 3, 0 });
    }
    SECTION("tms (y points up)")
    {
        const auto tiles = tile::Id { 1, { 1, 1 }, Scheme::Tms }.children();
        CHECK(tiles[0].coords == glm::uvec2 { 2, 2 });
        CHECK(tiles[1].coords == glm::uvec2 { 3, 2 });
        CHECK(tiles[2].coords == glm::uvec2 { 2, 3 });
        CHECK(tiles[3].coords == glm::uvec2 { 3, 3 });
    }
    SECTION("children are distinct and have the tile as parent")
    {
        const tile::Id parent { 13, { 4400, 2800 }, Scheme::SlippyMap };
        std::set<tile::Id> unique;
        for (const auto& child : parent.children()) {
            CHECK(child.parent() == parent);
            unique.insert(child);
        }
        CHECK(unique.size() == 4);
    }
    SECTION("children describe the same tiles in both schemes")
    {
        const tile::Id slippy { 5, { 17, 9 }, Scheme::SlippyMap };
        std::set<tile::Id> from_slippy;
        for (const auto& child : slippy.children())
            from_slippy.insert(child.to(Scheme::Tms));
        std::set<tile::Id> from_tms;
        for (const auto& child : slippy.to(Scheme::Tms).children())
            from_tms.insert(child);
        CHECK(from_slippy == from_tms);
    }
}

TEST_CASE("tile::Id validity, hashing and printing")
{
    CHECK(tile::Id { 0, { 0, 0 } }.is_valid());
    CHECK(tile::Id { 3, { 7, 7 } }.is_valid());
    CHECK(!tile::Id { 3, { 8, 0 } }.is_valid());
    CHECK(!tile::Id { 3, { 0, 8 } }.is_valid());
    CHECK(!tile::Id {}.is_valid());

    std::unordered_set<tile::Id, tile::Id::Hasher> set;
    set.insert({ 12, { 1, 2 }, Scheme::SlippyMap });
    set.insert({ 12, { 1, 2 }, Scheme::SlippyMap });
    set.insert({ 12, { 1, 2 }, Scheme::Tms });
    CHECK(set.size() == 2);

    CHECK(tile::to_string({ 12, { 2200, 1400 }, Scheme::SlippyMap }) == "Tile[Zoom=12, X=2200, Y=1400, slippy map]");
}

TEST_CASE("tile::Aabb intersection")
{
    const tile::SrsBounds a { { 0, 0 }, { 10, 10 } };
    const tile::SrsBounds b { { 5, -5 }, { 15, 5 } };
    const tile::SrsBounds c { { 11, 11 }, { 12, 12 } };
    CHECK(tile::intersect(a, b));
    CHECK(!tile::intersect(a, c));
    CHECK(tile::intersection(a, b) == tile::SrsBounds { { 5, 0 }, { 10, 5 } });
    CHECK(tile::intersection(a, c).width() < 0);
}
