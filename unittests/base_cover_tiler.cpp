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

#include <algorithm>
#include <set>

#include "catch2_helpers.h"

#include "BaseCoverTiler.h"
#include "Exception.h"
#include "ctb/GlobalMercator.hpp"

TEST_CASE("base cover tiler")
{
    const auto grid = ctb::GlobalMercator();

    SECTION("the whole grid")
    {
        const BaseCoverTiler tiler(grid, grid.getExtent(), tile::Scheme::SlippyMap);
        CHECK(tiler.generateTiles(0) == std::vector<tile::Id> { { 0, { 0, 0 }, tile::Scheme::SlippyMap } });

        const auto tiles = tiler.generateTiles(3);
        CHECK(tiles.size() == 64);
        const std::set<tile::Id> unique(tiles.begin(), tiles.end());
        CHECK(unique.size() == 64);
        for (const auto& t : tiles) {
            CHECK(t.scheme == tile::Scheme::SlippyMap);
            CHECK(t.is_valid());
        }
    }

    SECTION("bounds inside a single tile")
    {
        const auto tile_bounds = grid.srsBounds({ 12, { 2234, 1420 }, tile::Scheme::SlippyMap });
        const tile::SrsBounds inner { tile_bounds.min + 10.0, tile_bounds.max - 10.0 };
        const BaseCoverTiler tiler(grid, inner, tile::Scheme::SlippyMap);
        CHECK(tiler.generateTiles(12) == std::vector<tile::Id> { { 12, { 2234, 1420 }, tile::Scheme::SlippyMap } });
        CHECK(tiler.generateTiles(13).size() == 4);
    }

    SECTION("bounds ending on a tile border do not pull in the neighbours")
    {
        const auto tile_bounds = grid.srsBounds({ 12, { 2234, 1420 }, tile::Scheme::SlippyMap });
        const BaseCoverTiler tiler(grid, tile_bounds, tile::Scheme::SlippyMap);
        CHECK(tiler.generateTiles(12).size() == 1);
    }

    SECTION("every tile intersects the bounds")
    {
        const tile::SrsBounds austria { { 1060000.0, 5840000.0 }, { 1910000.0, 6280000.0 } };
        const BaseCoverTiler tiler(grid, austria, tile::Scheme::SlippyMap);
        const auto tiles = tiler.generateTiles(8);
        REQUIRE(!tiles.empty());
        for (const auto& t : tiles)
            CHECK(tile::intersect(grid.srsBounds(t), austria));
        CHECK(std::find(tiles.begin(), tiles.end(), tiler.southWestTile(8)) != tiles.end());
        CHECK(std::find(tiles.begin(), tiles.end(), tiler.northEastTile(8)) != tiles.end());
    }

    SECTION("bounds are clipped to the grid")
    {
        const tile::SrsBounds huge { { -1e9, -1e9 }, { 1e9, 1e9 } };
        const BaseCoverTiler tiler(grid, huge, tile::Scheme::SlippyMap);
        CHECK(tiler.bounds() == grid.getExtent());
        CHECK(tiler.generateTiles(2).size() == 16);
    }

    SECTION("bounds outside of the grid give an empty cover")
    {
        const tile::SrsBounds outside { { 3e7, 3e7 }, { 4e7, 4e7 } };
        const BaseCoverTiler tiler(grid, outside, tile::Scheme::SlippyMap);
        CHECK(tiler.generateTiles(5).empty());
    }

    SECTION("unsupported zoom levels throw")
    {
        const BaseCoverTiler tiler(grid, grid.getExtent(), tile::Scheme::SlippyMap);
        CHECK_THROWS_AS(tiler.generateTiles(31), Exception);
    }
}
