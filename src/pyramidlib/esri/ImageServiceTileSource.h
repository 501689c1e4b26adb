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

#ifndef ESRI_IMAGESERVICETILESOURCE_H
#define ESRI_IMAGESERVICETILESOURCE_H

#include <chrono>
#include <string>
#include <vector>

#include "ImageServiceClient.h"
#include "TileImageSource.h"
#include "Tiler.h"

namespace esri {

struct ServiceRequestOptions {
    unsigned tile_size = 256;
    std::string format = "png";
    std::string pixel_type = "U8";
    std::vector<int> no_data = { 255 };
    // bounds both the exportImage request and the download of its href
    std::chrono::milliseconds timeout = std::chrono::seconds(15);
};

/// Renders each tile of the web mercator grid with an exportImage call.
class ImageServiceTileSource : public TileImageSource {
public:
    ImageServiceTileSource(const ImageServiceClient& client, const Tiler& tiler, ServiceRequestOptions options);

    [[nodiscard]] tl::expected<TileImage, FetchError> fetch(const tile::Id& tile) const override;
    [[nodiscard]] ExportImageInput requestFor(const tile::Id& tile) const;

private:
    const ImageServiceClient& m_client;
    const Tiler& m_tiler;
    const ServiceRequestOptions m_options;
};

}

#endif // ESRI_IMAGESERVICETILESOURCE_H
