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

#ifndef ESRI_MODEL_H
#define ESRI_MODEL_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include "TileImageSource.h"
#include "http.h"

/// Request and response models of the ArcGIS REST ImageServer api.
/// https://developers.arcgis.com/rest/services-reference/enterprise/image-service.htm
namespace esri {

struct SpatialReference {
    int wkid = 0;
    int latest_wkid = 0;

    /// latestWkid if the service reports one, the epsg database knows the latest ids.
    [[nodiscard]] int preferredWkid() const { return latest_wkid > 0 ? latest_wkid : wkid; }
};

struct Extent {
    double xmin = 0;
    double ymin = 0;
    double xmax = 0;
    double ymax = 0;
    SpatialReference spatial_reference;

    [[nodiscard]] bool empty() const { return !(xmax > xmin && ymax > ymin); }
};

struct ServiceDetails {
    std::optional<Extent> extent;
    std::optional<Extent> initial_extent;
    std::optional<Extent> full_extent;
};

struct ImageSize {
    unsigned width = 256;
    unsigned height = 256;
};

struct ExportImageInput {
    Extent bounding_box;
    ImageSize size;
    int image_sr = 3857;
    // one of jpgpng, png, png8, png24, png32, jpg, bmp, gif, tiff
    std::string format = "png";
    // one of C128, C64, F32, F64, S16, S32, S8, U1, U16, U2, U32, U4, U8
    std::string pixel_type = "U8";
    // values rendered transparent
    std::vector<int> no_data = { 255 };
};

struct ExportImageOutput {
    std::string href;
    unsigned width = 0;
    unsigned height = 0;
    Extent extent;
    double scale = 0;
};

void from_json(const nlohmann::json& j, SpatialReference& sr);
void from_json(const nlohmann::json& j, Extent& extent);
void from_json(const nlohmann::json& j, ServiceDetails& details);
void from_json(const nlohmann::json& j, ExportImageOutput& output);

/// parses a response body. an {"error": {...}} document becomes FetchErrorKind::ServiceError.
[[nodiscard]] tl::expected<ServiceDetails, FetchError> parse_service_details(std::string_view body);
[[nodiscard]] tl::expected<ExportImageOutput, FetchError> parse_export_image_output(std::string_view body);

/// an exportImage reply carries either the rendered image or the href to download it from.
struct ExportImageReply {
    std::optional<TileImage> image;
    std::string href;
};

/// image content types are taken as the image, anything else must be an exportImage json with an href.
[[nodiscard]] tl::expected<ExportImageReply, FetchError> image_or_href(http::Response response);
/// rejects downloads of href that are not an image (e.g. an html error page).
[[nodiscard]] tl::expected<TileImage, FetchError> downloaded_image(http::Response response, std::string_view href);

/// query parameters of an exportImage request, in the order the service documents them.
[[nodiscard]] http::QueryParameters export_image_query(const ExportImageInput& input);

}

#endif // ESRI_MODEL_H
