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

#ifndef SRS_H
#define SRS_H

#include <algorithm>
#include <array>
#include <memory>

#include <fmt/core.h>
#include <ogr_spatialref.h>

#include "Exception.h"
#include "tile.h"

namespace srs {

inline std::unique_ptr<OGRCoordinateTransformation> transformation(const OGRSpatialReference& source, const OGRSpatialReference& targetSrs)
{
    const auto data_srs = source;
    auto transformer = std::unique_ptr<OGRCoordinateTransformation>(OGRCreateCoordinateTransformation(&data_srs, &targetSrs));
    if (!transformer)
        throw Exception("Couldn't create SRS transformation");
    return transformer;
}

// this transform is non exact, because we are only transforming the corner vertices. however, due to projection warping, a rectangle can become an trapezoid with curved edges.
inline tile::SrsBounds nonExactBoundsTransform(const tile::SrsBounds& bounds, const OGRSpatialReference& sourceSrs, const OGRSpatialReference& targetSrs)
{
    const auto transform = transformation(sourceSrs, targetSrs);
    std::array xes = { bounds.min.x, bounds.max.x };
    std::array yes = { bounds.min.y, bounds.max.y };
    if (!transform->Transform(2, xes.data(), yes.data()))
        throw Exception("nonExactBoundsTransform failed");
    return { { std::min(xes[0], xes[1]), std::min(yes[0], yes[1]) }, { std::max(xes[0], xes[1]), std::max(yes[0], yes[1]) } };
}

// ArcGIS services report web mercator with esri specific well known ids, which are not in the EPSG database.
[[nodiscard]] inline int epsg_for_wkid(int wkid)
{
    switch (wkid) {
    case 102100:
    case 102113:
    case 900913:
        return 3857;
    default:
        return wkid;
    }
}

[[nodiscard]] inline OGRSpatialReference from_wkid(int wkid)
{
    OGRSpatialReference srs;
    if (wkid <= 0 || srs.importFromEPSG(epsg_for_wkid(wkid)) != OGRERR_NONE)
        throw Exception(fmt::format("Unsupported spatial reference wkid {}", wkid));
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

[[nodiscard]] inline OGRSpatialReference wgs84()
{
    return from_wkid(4326);
}
}

#endif // SRS_H
