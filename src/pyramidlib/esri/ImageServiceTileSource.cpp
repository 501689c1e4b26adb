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

#include "ImageServiceTileSource.h"

#include <utility>

#include "Exception.h"

esri::ImageServiceTileSource::ImageServiceTileSource(const ImageServiceClient& client, const Tiler& tiler, ServiceRequestOptions options)
    : m_client(client)
    , m_tiler(tiler)
    , m_options(std::move(options))
{
    if (m_options.tile_size == 0)
        throw Exception("The tile size must not be 0.");
}

esri::ExportImageInput esri::ImageServiceTileSource::requestFor(const tile::Id& tile) const
{
    const auto descriptor = m_tiler.tile_for(tile);
    const auto& bounds = descriptor.srsBounds;

    ExportImageInput input;
    input.bounding_box = { bounds.min.x, bounds.min.y, bounds.max.x, bounds.max.y, { descriptor.srs_epsg, descriptor.srs_epsg } };
    input.size = { m_options.tile_size, m_options.tile_size };
    input.image_sr = descriptor.srs_epsg;
    input.format = m_options.format;
    input.pixel_type = m_options.pixel_type;
    input.no_data = m_options.no_data;
    return input;
}

tl::expected<TileImage, FetchError> esri::ImageServiceTileSource::fetch(const tile::Id& tile) const
{
    const auto deadline = ImageServiceClient::Clock::now() + m_options.timeout;
    return m_client.exportImage(requestFor(tile), deadline);
}
