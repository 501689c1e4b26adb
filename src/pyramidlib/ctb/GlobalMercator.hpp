#ifndef GLOBALMERCATOR_HPP
#define GLOBALMERCATOR_HPP

/*******************************************************************************
 * Copyright 2014 GeoData <geodata@soton.ac.uk>
 * Copyright 2022 Adam Celarek <family name at cg tuwien ac at>
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may not
 * use this file except in compliance with the License.  You may obtain a copy
 * of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
 * WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.  See the
 * License for the specific language governing permissions and limitations
 * under the License.
 *******************************************************************************/

/**
 * @file GlobalMercator.hpp
 * @brief This defines the `GlobalMercator` class
 */

#include <numbers>

#include "Exception.h"
#include "Grid.hpp"

namespace ctb {
class GlobalMercator;
}

/**
 * @brief An implementation of the TMS Global Mercator Profile
 *
 * This class models the [Tile Mapping Service Global Mercator
 * Profile](http://wiki.osgeo.org/wiki/Tile_Map_Service_Specification#global-mercator)
 * in EPSG:3857 with a single root tile. ArcGIS services call the same
 * projection wkid 102100.
 */
class ctb::GlobalMercator : public ctb::Grid {
public:
    static constexpr double cSemiMajorAxis = 6378137;
    static constexpr double cEarthCircumference = 2 * std::numbers::pi * cSemiMajorAxis;
    static constexpr double cOriginShift = cEarthCircumference / 2.0;

    GlobalMercator(i_tile tileSize = 256)
        : Grid(tileSize,
            tile::SrsBounds { { -cOriginShift, -cOriginShift }, { cOriginShift, cOriginShift } },
            mercatorSrs(),
            3857,
            { tile::Id { 0, { 0, 0 }, tile::Scheme::Tms } },
            2)
    {
    }

private:
    static OGRSpatialReference mercatorSrs()
    {
        OGRSpatialReference srs;
        if (srs.importFromEPSG(3857) != OGRERR_NONE)
            throw Exception("Couldn't create the EPSG:3857 spatial reference (is the PROJ database installed?)");
        srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        return srs;
    }
};

#endif /* GLOBALMERCATOR_HPP */
