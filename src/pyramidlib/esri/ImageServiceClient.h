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

#ifndef ESRI_IMAGESERVICECLIENT_H
#define ESRI_IMAGESERVICECLIENT_H

#include <chrono>
#include <string>

#include <tl/expected.hpp>

#include "TileImageSource.h"
#include "model.h"

namespace esri {

/// Thin client for one ArcGIS ImageServer endpoint, e.g. https://host/arcgis/rest/services/Name/ImageServer.
/// Stateless, may be used from any number of threads.
class ImageServiceClient {
public:
    using Clock = std::chrono::steady_clock;

    explicit ImageServiceClient(std::string endpoint);

    [[nodiscard]] tl::expected<ServiceDetails, FetchError> details(std::chrono::milliseconds timeout) const;
    /// renders the image. services may either answer with the image itself or with a json pointing to it (href),
    /// in the latter case the image is downloaded before the deadline as well.
    [[nodiscard]] tl::expected<TileImage, FetchError> exportImage(const ExportImageInput& input, Clock::time_point deadline) const;
    [[nodiscard]] tl::expected<TileImage, FetchError> download(const std::string& href, Clock::time_point deadline) const;

    [[nodiscard]] const std::string& endpoint() const;
    [[nodiscard]] std::string detailsUrl() const;
    [[nodiscard]] std::string exportImageUrl(const ExportImageInput& input) const;

private:
    std::string m_endpoint;
};

}

#endif // ESRI_IMAGESERVICECLIENT_H
