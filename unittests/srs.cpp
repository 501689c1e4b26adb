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

#include "Exception.h"
#include "ctb/GlobalMercator.hpp"
#include "srs.h"

TEST_CASE("srs")
{
    SECTION("esri web mercator wkids")
    {
        CHECK(srs::epsg_for_wkid(102100) == 3857);
        CHECK(srs::epsg_for_wkid(102113) == 3857);
        CHECK(srs::epsg_for_wkid(3857) == 3857);
        CHECK(srs::epsg_for_wkid(31287) == 31287);

        const auto esri_mercator = srs::from_wkid(102100);
        const auto mercator = ctb::GlobalMercator().getSRS();
        CHECK(esri_mercator.IsSame(&mercator));
    }

    SECTION("unsupported wkids throw")
    {
        CHECK_THROWS_AS(srs::from_wkid(0), Exception);
        CHECK_THROWS_AS(srs::from_wkid(-5), Exception);
        CHECK_THROWS_AS(srs::from_wkid(999999), Exception);
    }

    SECTION("bounds transform")
    {
        const auto grid = ctb::GlobalMercator();
        const tile::SrsBounds world { { -180, -85.0511287798 }, { 180, 85.0511287798 } };
        const auto mercator_bounds = srs::nonExactBoundsTransform(world, srs::wgs84(), grid.getSRS());
        CHECK(mercator_bounds.min.x == Approx(grid.getExtent().min.x));
        CHECK(mercator_bounds.min.y == Approx(grid.getExtent().min.y));
        CHECK(mercator_bounds.max.x == Approx(grid.getExtent().max.x));
        CHECK(mercator_bounds.max.y == Approx(grid.getExtent().max.y));

        const auto back = srs::nonExactBoundsTransform(mercator_bounds, grid.getSRS(), srs::wgs84());
        CHECK(back.min.x == Approx(-180));
        CHECK(back.max.y == Approx(85.0511287798));
    }
}
