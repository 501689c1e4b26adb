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
#include "ExtentResolver.h"
#include "ctb/GlobalMercator.hpp"
#include "esri/model.h"

namespace {
const std::string details_json = R"({
  "currentVersion": 10.81,
  "serviceDescription": "Orthophoto",
  "extent": {"xmin": 1060000.5, "ymin": 5840000.25, "xmax": 1910000, "ymax": 6280000, "spatialReference": {"wkid": 102100, "latestWkid": 3857}},
  "initialExtent": {"xmin": 1100000, "ymin": 5900000, "xmax": 1800000, "ymax": 6200000, "spatialReference": {"wkid": 102100}},
  "fullExtent": {"xmin": 1060000, "ymin": 5840000, "xmax": 1910000, "ymax": 6280000, "spatialReference": {"wkid": 102100, "latestWkid": 3857}},
  "pixelSizeX": 0.3
})";
}

TEST_CASE("esri service details")
{
    SECTION("parses all extents")
    {
        const auto details = esri::parse_service_details(details_json);
        REQUIRE(details.has_value());
        REQUIRE(details->extent.has_value());
        CHECK(details->extent->xmin == 1060000.5);
        CHECK(details->extent->ymin == 5840000.25);
        CHECK(details->extent->spatial_reference.wkid == 102100);
        CHECK(details->extent->spatial_reference.latest_wkid == 3857);
        CHECK(details->extent->spatial_reference.preferredWkid() == 3857);
        REQUIRE(details->initial_extent.has_value());
        CHECK(details->initial_extent->spatial_reference.preferredWkid() == 102100);
        REQUIRE(details->full_extent.has_value());
        CHECK(details->full_extent->xmax == 1910000);
    }

    SECTION("the full extent is preferred")
    {
        const auto details = esri::parse_service_details(details_json);
        REQUIRE(details.has_value());
        CHECK(extent::select_extent(*details).xmin == 1060000);

        esri::ServiceDetails only_initial;
        only_initial.initial_extent = details->initial_extent;
        CHECK(extent::select_extent(only_initial).xmin == 1100000);
        CHECK_THROWS_AS(extent::select_extent(esri::ServiceDetails {}), Exception);
    }

    SECTION("service errors")
    {
        const auto details = esri::parse_service_details(R"({"error": {"code": 499, "message": "Token Required", "details": []}})");
        REQUIRE(!details.has_value());
        CHECK(details.error() == FetchErrorKind::ServiceError);
        CHECK(details.error().description().find("Token Required") != std::string::npos);
    }

    SECTION("error documents with unexpected member types")
    {
        const auto string_code = esri::parse_service_details(R"({"error": {"code": "400", "message": null}})");
        REQUIRE(!string_code.has_value());
        CHECK(string_code.error() == FetchErrorKind::MalformedResponse);

        const auto null_message = esri::parse_export_image_output(R"({"error": {"code": 500, "message": null}})");
        REQUIRE(!null_message.has_value());
        CHECK(null_message.error() == FetchErrorKind::MalformedResponse);
    }

    SECTION("malformed documents")
    {
        CHECK(esri::parse_service_details("<html>502 Bad Gateway</html>").error() == FetchErrorKind::MalformedResponse);
        CHECK(esri::parse_service_details("[1, 2]").error() == FetchErrorKind::MalformedResponse);
        CHECK(esri::parse_service_details(R"({"extent": {"xmin": "a"}})").error() == FetchErrorKind::MalformedResponse);
    }
}

TEST_CASE("esri export image")
{
    SECTION("response with href")
    {
        const auto output = esri::parse_export_image_output(R"({
          "href": "https://example.com/arcgis/rest/directories/arcgisoutput/_ags_a1b2.png",
          "width": 256, "height": 256,
          "extent": {"xmin": 1820000, "ymin": 6140000, "xmax": 1830000, "ymax": 6150000, "spatialReference": {"wkid": 102100, "latestWkid": 3857}},
          "scale": 35000.5
        })");
        REQUIRE(output.has_value());
        CHECK(output->href == "https://example.com/arcgis/rest/directories/arcgisoutput/_ags_a1b2.png");
        CHECK(output->width == 256);
        CHECK(output->height == 256);
        CHECK(output->extent.xmax == 1830000);
        CHECK(output->scale == 35000.5);
    }

    SECTION("response without href")
    {
        CHECK(esri::parse_export_image_output(R"({"width": 256})").error() == FetchErrorKind::MalformedResponse);
    }

    SECTION("image content types are the image itself")
    {
        http::Response response { 200, "image/png", { 0x89, 'P', 'N', 'G' } };
        const auto reply = esri::image_or_href(response);
        REQUIRE(reply.has_value());
        REQUIRE(reply->image.has_value());
        CHECK(*reply->image == response.body);
        CHECK(reply->href.empty());
    }

    SECTION("json replies point to the image")
    {
        const std::string body = R"({"href": "https://example.com/arcgisoutput/_ags_c3d4.png", "width": 256, "height": 256})";
        const auto reply = esri::image_or_href({ 200, "text/plain;charset=utf-8", { body.begin(), body.end() } });
        REQUIRE(reply.has_value());
        CHECK(!reply->image.has_value());
        CHECK(reply->href == "https://example.com/arcgisoutput/_ags_c3d4.png");
    }

    SECTION("json replies without an image")
    {
        const std::string error = R"({"error": {"code": 400, "message": "Unable to complete operation.", "details": []}})";
        const auto service_error = esri::image_or_href({ 200, "application/json", { error.begin(), error.end() } });
        REQUIRE(!service_error.has_value());
        CHECK(service_error.error() == FetchErrorKind::ServiceError);

        const std::string empty_href = R"({"href": "", "width": 256})";
        CHECK(esri::image_or_href({ 200, "application/json", { empty_href.begin(), empty_href.end() } }).error() == FetchErrorKind::MalformedResponse);
    }

    SECTION("downloads must be images")
    {
        const std::string html = "<html>404 Not Found</html>";
        const auto rejected = esri::downloaded_image({ 200, "text/html", { html.begin(), html.end() } }, "https://example.com/_ags_c3d4.png");
        REQUIRE(!rejected.has_value());
        CHECK(rejected.error() == FetchErrorKind::MalformedResponse);
        CHECK(rejected.error().message().find("text/html") != std::string::npos);

        const auto image = esri::downloaded_image({ 200, "image/jpeg", { 0xff, 0xd8 } }, "https://example.com/_ags_c3d4.jpg");
        REQUIRE(image.has_value());
        CHECK(*image == TileImage { 0xff, 0xd8 });
    }

    SECTION("query parameters")
    {
        esri::ExportImageInput input;
        input.bounding_box = { 1822585.5, 6141438.25, 1832369.4, 6151222.1, { 3857, 3857 } };
        input.no_data = { 0, 255 };

        const auto query = esri::export_image_query(input);
        const http::QueryParameters expected = {
            { "f", "pjson" },
            { "bbox", "1822585.500000,6141438.250000,1832369.400000,6151222.100000" },
            { "bboxSR", "3857" },
            { "size", "256,256" },
            { "imageSR", "3857" },
            { "format", "png" },
            { "pixelType", "U8" },
            { "noData", "0,255" },
        };
        CHECK(query == expected);

        input.no_data.clear();
        CHECK(esri::export_image_query(input).size() == expected.size() - 1);
    }
}

TEST_CASE("service extent to grid bounds")
{
    const auto grid = ctb::GlobalMercator();

    SECTION("web mercator extents are taken as they are")
    {
        const esri::Extent extent { 1060000, 5840000, 1910000, 6280000, { 102100, 3857 } };
        const auto bounds = extent::to_grid_bounds(extent, grid);
        CHECK(bounds == tile::SrsBounds { { 1060000, 5840000 }, { 1910000, 6280000 } });
    }

    SECTION("geographic extents are reprojected and clamped to the mercator range")
    {
        const esri::Extent world { -200, -90, 200, 90, { 4326, 4326 } };
        const auto bounds = extent::to_grid_bounds(world, grid);
        CHECK(bounds.min.x == Approx(grid.getExtent().min.x));
        CHECK(bounds.max.y == Approx(grid.getExtent().max.y));

        const auto wgs84 = extent::to_wgs84_bounds(bounds, grid);
        CHECK(wgs84.min.x == Approx(-180));
        CHECK(wgs84.max.x == Approx(180));
        CHECK(wgs84.max.y == Approx(85.0511287798));
    }

    SECTION("extents outside of the grid or without srs are rejected")
    {
        CHECK_THROWS_AS(extent::to_grid_bounds({ 3e7, 3e7, 4e7, 4e7, { 3857, 0 } }, grid), Exception);
        CHECK_THROWS_AS(extent::to_grid_bounds({ 0, 0, 1, 1, {} }, grid), Exception);
    }
}
