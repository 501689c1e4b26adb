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

#include "model.h"

#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace {
template <typename T>
tl::expected<T, FetchError> parse(std::string_view body, std::string_view what)
{
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object())
        return tl::unexpected(FetchError(FetchErrorKind::MalformedResponse, fmt::format("{} is not a json object", what)));

    try {
        if (const auto error = json.find("error"); error != json.end() && error->is_object()) {
            const auto code = error->value("code", 0);
            const auto message = error->value("message", std::string("unknown error"));
            return tl::unexpected(FetchError(FetchErrorKind::ServiceError, fmt::format("{} {}: {}", what, code, message)));
        }
        return json.get<T>();
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(FetchError(FetchErrorKind::MalformedResponse, fmt::format("{}: {}", what, e.what())));
    }
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, T& target)
{
    if (const auto it = j.find(key); it != j.end() && !it->is_null())
        it->get_to(target);
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& target)
{
    if (const auto it = j.find(key); it != j.end() && !it->is_null())
        target = it->template get<T>();
}
}

void esri::from_json(const nlohmann::json& j, SpatialReference& sr)
{
    get_optional(j, "wkid", sr.wkid);
    get_optional(j, "latestWkid", sr.latest_wkid);
}

void esri::from_json(const nlohmann::json& j, Extent& extent)
{
    j.at("xmin").get_to(extent.xmin);
    j.at("ymin").get_to(extent.ymin);
    j.at("xmax").get_to(extent.xmax);
    j.at("ymax").get_to(extent.ymax);
    get_optional(j, "spatialReference", extent.spatial_reference);
}

void esri::from_json(const nlohmann::json& j, ServiceDetails& details)
{
    get_optional(j, "extent", details.extent);
    get_optional(j, "initialExtent", details.initial_extent);
    get_optional(j, "fullExtent", details.full_extent);
}

void esri::from_json(const nlohmann::json& j, ExportImageOutput& output)
{
    j.at("href").get_to(output.href);
    get_optional(j, "width", output.width);
    get_optional(j, "height", output.height);
    get_optional(j, "extent", output.extent);
    get_optional(j, "scale", output.scale);
}

tl::expected<esri::ServiceDetails, FetchError> esri::parse_service_details(std::string_view body)
{
    return parse<ServiceDetails>(body, "service details");
}

tl::expected<esri::ExportImageOutput, FetchError> esri::parse_export_image_output(std::string_view body)
{
    return parse<ExportImageOutput>(body, "exportImage response");
}

tl::expected<esri::ExportImageReply, FetchError> esri::image_or_href(http::Response response)
{
    if (response.is_image())
        return ExportImageReply { std::move(response.body), {} };

    const auto output = parse_export_image_output(response.text());
    if (!output)
        return tl::unexpected(output.error());
    if (output->href.empty())
        return tl::unexpected(FetchError(FetchErrorKind::MalformedResponse, "exportImage response without href"));
    return ExportImageReply { std::nullopt, output->href };
}

tl::expected<TileImage, FetchError> esri::downloaded_image(http::Response response, std::string_view href)
{
    if (!response.is_image())
        return tl::unexpected(FetchError(FetchErrorKind::MalformedResponse, fmt::format("{} returned content type '{}' instead of an image", href, response.content_type)));
    return std::move(response.body);
}

http::QueryParameters esri::export_image_query(const ExportImageInput& input)
{
    const auto& bbox = input.bounding_box;
    http::QueryParameters query = {
        { "f", "pjson" },
        { "bbox", fmt::format("{:f},{:f},{:f},{:f}", bbox.xmin, bbox.ymin, bbox.xmax, bbox.ymax) },
        { "bboxSR", std::to_string(bbox.spatial_reference.wkid) },
        { "size", fmt::format("{},{}", input.size.width, input.size.height) },
        { "imageSR", std::to_string(input.image_sr) },
        { "format", input.format },
        { "pixelType", input.pixel_type },
    };
    if (!input.no_data.empty())
        query.emplace_back("noData", fmt::format("{}", fmt::join(input.no_data, ",")));
    return query;
}
