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

#include "catch2_helpers.h"

#include "ctb/GlobalMercator.hpp"

TEST_CASE("global mercator grid")
{
    const auto grid = ctb::GlobalMercator(256);

    SECTION("srs")
    {
        CHECK(grid.getEpsgCode() == 3857);
        CHECK(grid.tileSize() == 256);
        REQUIRE(grid.rootTiles().size() == 1);
        CHECK(grid.rootTiles().front() == tile::Id { 0, { 0, 0 }, tile::Scheme::Tms });
    }

    SECTION("extent")
    {
        const auto lim = 20037508.342789244;
        CHECK(grid.getExtent().min.x == Approx(-lim));
        CHECK(grid.getExtent().max.x == Approx(lim));
        CHECK(grid.getExtent().min.y == Approx(-lim));
        CHECK(grid.getExtent().max.y == Approx(lim));
    }

    SECTION("resolution halves with every zoom level")
    {
        CHECK(grid.resolution(0) == Approx(156543.03392804097));
        CHECK(grid.resolution(1) == Approx(grid.resolution(0) / 2));
        CHECK(grid.resolution(12) == Approx(grid.resolution(0) / 4096));
    }

    SECTION("tile bounds")
    {
        CHECK(grid.srsBounds({ 0, { 0, 0 }, tile::Scheme::Tms }) == grid.getExtent());

        // the south western quarter, in both schemes
        const auto sw_tms = grid.srsBounds({ 1, { 0, 0 }, tile::Scheme::Tms });
        const auto sw_slippy = grid.srsBounds({ 1, { 0, 1 }, tile::Scheme::SlippyMap });
        CHECK(sw_tms == sw_slippy);
        CHECK(sw_tms.min.x == Approx(grid.getExtent().min.x));
        CHECK(sw_tms.min.y == Approx(grid.getExtent().min.y));
        CHECK(sw_tms.max.x == Approx(0).margin(0.000001));
        CHECK(sw_tms.max.y == Approx(0).margin(0.000001));
    }

    SECTION("crs to tile")
    {
        CHECK(grid.crsToTile({ 1, 1 }, 1) == tile::Id { 1, { 1, 1 }, tile::Scheme::Tms });
        CHECK(grid.crsToTile({ -1, -1 }, 1) == tile::Id { 1, { 0, 0 }, tile::Scheme::Tms });
        // vienna, stephansdom
        CHECK(grid.crsToTile({ 1822585.0, 6141438.0 }, 12) == tile::Id { 12, { 2234, 4095 - 1420 }, tile::Scheme::Tms });
        // coordinates outside of the grid are clamped
        CHECK(grid.crsToTile({ 1e9, 1e9 }, 2) == tile::Id { 2, { 3, 3 }, tile::Scheme::Tms });
        CHECK(grid.crsToTile({ -1e9, -1e9 }, 2) == tile::Id { 2, { 0, 0 }, tile::Scheme::Tms });
    }
}
