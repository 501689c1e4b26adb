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

#include <string>

#include "catch2_helpers.h"

#include "Exception.h"
#include "ctb/GlobalMercator.hpp"
#include "esri/ImageServiceClient.h"
#include "esri/ImageServiceTileSource.h"
#include "http.h"

using namespace std::literals;

TEST_CASE("http")
{
    const http::CurlGlobal curl;

    SECTION("query strings")
    {
        CHECK(http::build_url("https://example.com/ImageServer", { { "f", "json" } }) == "https://example.com/ImageServer?f=json");
        CHECK(http::build_url("https://example.com/ImageServer", { { "f", "json" }, { "size", "256" } }) == "https://example.com/ImageServer?f=json&size=256");
        CHECK(http::build_url("https://example.com/ImageServer?token=abc", { { "f", "json" } }) == "https://example.com/ImageServer?token=abc&f=json");

        // separators inside of values are encoded
        const auto encoded = http::build_url("https://example.com/ImageServer", { { "q", "a b&c" } });
        CHECK(encoded.find("a b") == std::string::npos);
        CHECK(encoded.find("&c") == std::string::npos);

        CHECK_THROWS_AS(http::build_url("not a url", {}), Exception);
    }

    SECTION("expired deadlines fail without a request")
    {
        const auto response = http::get("https://example.com", 0ms);
        REQUIRE(!response.has_value());
        CHECK(response.error() == FetchErrorKind::Timeout);
    }
}

TEST_CASE("image service client urls")
{
    const http::CurlGlobal curl;
    const esri::ImageServiceClient client("https://example.com/arcgis/rest/services/Ortho/ImageServer/");
    CHECK(client.endpoint() == "https://example.com/arcgis/rest/services/Ortho/ImageServer");
    CHECK(client.detailsUrl() == "https://example.com/arcgis/rest/services/Ortho/ImageServer?f=json");

    const auto grid = ctb::GlobalMercator();
    const Tiler tiler(grid, grid.getExtent(), tile::Scheme::SlippyMap);
    const esri::ImageServiceTileSource source(client, tiler, {});
    const auto input = source.requestFor({ 1, { 0, 0 }, tile::Scheme::SlippyMap });
    // the north western quarter
    CHECK(input.bounding_box.xmin == Approx(-20037508.342789244));
    CHECK(input.bounding_box.xmax == Approx(0).margin(0.000001));
    CHECK(input.bounding_box.ymin == Approx(0).margin(0.000001));
    CHECK(input.bounding_box.ymax == Approx(20037508.342789244));
    CHECK(input.bounding_box.spatial_reference.wkid == 3857);
    CHECK(input.image_sr == 3857);
    CHECK(input.size.width == 256);
    CHECK(input.size.height == 256);

    const auto url = client.exportImageUrl(input);
    CHECK(url.starts_with("https://example.com/arcgis/rest/services/Ortho/ImageServer/exportImage?f=pjson&bbox="));
    CHECK(url.find("&bboxSR=3857&size=") != std::string::npos);
    CHECK(url.find("&imageSR=3857&format=png&pixelType=U8&noData=255") != std::string::npos);

    CHECK_THROWS_AS(esri::ImageServiceClient(""), Exception);
}
