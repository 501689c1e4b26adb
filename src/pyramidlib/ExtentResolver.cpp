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

#include "ExtentResolver.h"

#include <algorithm>

#include <fmt/core.h>

#include "Exception.h"
#include "log.h"
#include "srs.h"

namespace {
// web mercator is undefined at the poles
constexpr double cMaxMercatorLatitude = 85.05112878;
}

esri::Extent extent::select_extent(const esri::ServiceDetails& details)
{
    for (const auto& candidate : { details.full_extent, details.extent, details.initial_extent }) {
        if (candidate && !candidate->empty())
            return *candidate;
    }
    throw Exception("The service details contain no usable extent.");
}

esri::Extent extent::fetch_full_extent(const esri::ImageServiceClient& client, std::chrono::milliseconds timeout)
{
    const auto details = client.details(timeout);
    if (!details)
        throw Exception(fmt::format("Querying the service details of {} failed: {}", client.endpoint(), details.error().description()));

    const auto extent = select_extent(*details);
    LOG_INFO("Service extent: {}, {}, {}, {} (wkid {})", extent.xmin, extent.ymin, extent.xmax, extent.ymax, extent.spatial_reference.preferredWkid());
    return extent;
}

tile::SrsBounds extent::to_grid_bounds(const esri::Extent& extent, const ctb::Grid& grid)
{
    const int wkid = extent.spatial_reference.preferredWkid();
    if (wkid <= 0)
        throw Exception("The service extent has no spatial reference.");

    tile::SrsBounds bounds { { extent.xmin, extent.ymin }, { extent.xmax, extent.ymax } };
    if (srs::epsg_for_wkid(wkid) != grid.getEpsgCode()) {
        const auto source_srs = srs::from_wkid(wkid);
        if (source_srs.IsGeographic()) {
            bounds.min = { std::clamp(bounds.min.x, -180.0, 180.0), std::clamp(bounds.min.y, -cMaxMercatorLatitude, cMaxMercatorLatitude) };
            bounds.max = { std::clamp(bounds.max.x, -180.0, 180.0), std::clamp(bounds.max.y, -cMaxMercatorLatitude, cMaxMercatorLatitude) };
        }
        bounds = srs::nonExactBoundsTransform(bounds, source_srs, grid.getSRS());
    }

    if (!tile::intersect(bounds, grid.getExtent()))
        throw Exception(fmt::format("The service extent ({}, {}, {}, {}) lies outside of the tiling grid.", bounds.min.x, bounds.min.y, bounds.max.x, bounds.max.y));
    return tile::intersection(bounds, grid.getExtent());
}

tile::SrsBounds extent::to_wgs84_bounds(const tile::SrsBounds& grid_bounds, const ctb::Grid& grid)
{
    return srs::nonExactBoundsTransform(grid_bounds, grid.getSRS(), srs::wgs84());
}
