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

#ifndef EXTENTRESOLVER_H
#define EXTENTRESOLVER_H

#include <chrono>

#include "ctb/Grid.hpp"
#include "esri/ImageServiceClient.h"
#include "esri/model.h"
#include "tile.h"

namespace extent {

/// queries the service details and returns fullExtent (falling back to extent, then initialExtent).
/// throws Exception if the service can not be reached or reports no usable extent.
[[nodiscard]] esri::Extent fetch_full_extent(const esri::ImageServiceClient& client, std::chrono::milliseconds timeout);

/// picks the extent the pyramid is built for out of the service details.
[[nodiscard]] esri::Extent select_extent(const esri::ServiceDetails& details);

/// reprojects the extent into the grid srs and clips it to the grid. throws Exception if nothing is left.
[[nodiscard]] tile::SrsBounds to_grid_bounds(const esri::Extent& extent, const ctb::Grid& grid);

/// west, south, east, north in degrees, for the mbtiles metadata.
[[nodiscard]] tile::SrsBounds to_wgs84_bounds(const tile::SrsBounds& grid_bounds, const ctb::Grid& grid);

}

#endif // EXTENTRESOLVER_H
