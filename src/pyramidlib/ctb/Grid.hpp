#ifndef CTBGRID_HPP
#define CTBGRID_HPP

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
 * @file Grid.hpp
 * @brief This defines and declares the `Grid` class
 */

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include <ogr_spatialref.h>

#include "tile.h"
#include "types.hpp"

namespace ctb {
class Grid;
}

/**
 * @brief A generic grid for cutting tile sets
 *
 * This class models a grid for use in cutting up an area into zoom levels and
 * tiles.  It provides functionality such as relating a coordinate in a native
 * coordinate reference system (CRS) to a tile (see `Grid::crsToTile`) and
 * getting the CRS bounds of a tile (see `Grid::srsBounds`).
 *
 * The code here generalises the logic in the `gdal2tiles.py` script available
 * with the GDAL library.
 *
 * Warning: The y direction is dangerous. ctb::Grid is always positive pointing north,
 *          i.e. it computes tms tile ids. Slippy map ids are converted in tile.h.
 */
class ctb::Grid {
public:
    /// Initialise a grid tile
    Grid(i_tile gridSize,
        const tile::SrsBounds extent,
        const OGRSpatialReference& srs,
        int epsgCode,
        std::vector<tile::Id> rootTiles,
        double zoomFactor)
        : mGridSize(gridSize)
        , mExtent(extent)
        , mSRS(srs)
        , mEpsgCode(epsgCode)
        , mInitialResolution((extent.width() / double(rootTiles.size())) / gridSize)
        , mXOriginShift(extent.width() / 2)
        , mYOriginShift(extent.height() / 2)
        , mZoomFactor(zoomFactor)
        , mRootTiles(std::move(rootTiles))
    {
        mSRS.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    }

    /// Get the resolution for a particular zoom level
    [[nodiscard]] inline double resolution(i_zoom zoom) const
    {
        return mInitialResolution / std::pow(mZoomFactor, zoom);
    }

    /// Get the tile covering a pixel location
    [[nodiscard]] inline TilePoint pixelsToTile(const PixelPoint& pixel) const
    {
        const auto tx = i_tile(std::max(0.0, std::floor(pixel.x / mGridSize)));
        const auto ty = i_tile(std::max(0.0, std::floor(pixel.y / mGridSize)));

        return { tx, ty };
    }

    /// Convert pixel coordinates at a given zoom level to CRS coordinates
    [[nodiscard]] inline CRSPoint pixelsToCrs(const PixelPoint& pixel, i_zoom zoom) const
    {
        double res = resolution(zoom);

        return {
            (pixel.x * res) - mXOriginShift,
            (pixel.y * res) - mYOriginShift
        };
    }

    /// Get the pixel location represented by a CRS point and zoom level
    [[nodiscard]] inline PixelPoint crsToPixels(const CRSPoint& coord, i_zoom zoom) const
    {
        const auto res = resolution(zoom);
        const auto px = (mXOriginShift + coord.x) / res;
        const auto py = (mYOriginShift + coord.y) / res;

        return { px, py };
    }

    /// Get the tile coordinate in which a location falls at a specific zoom level.
    /// Locations outside of the grid are clamped to the border tiles.
    [[nodiscard]] inline tile::Id crsToTile(const CRSPoint& coord, i_zoom zoom) const
    {
        const PixelPoint pixel = crsToPixels(coord, zoom);
        TilePoint tile = pixelsToTile(pixel);
        const auto n_tiles = i_tile(mRootTiles.size()) << zoom;
        tile.x = std::min(tile.x, n_tiles - 1);
        tile.y = std::min(tile.y, (1u << zoom) - 1);

        return { zoom, tile, tile::Scheme::Tms };
    }

    /// Get the CRS bounds of a particular tile
    [[nodiscard]] inline tile::SrsBounds srsBounds(const tile::Id& tile_id) const
    {
        const auto tms_tile_id = tile_id.to(tile::Scheme::Tms);
        // get the pixels coordinates representing the tile bounds
        const PixelPoint pxMinLeft(double(tms_tile_id.coords.x) * mGridSize, double(tms_tile_id.coords.y) * mGridSize);
        const PixelPoint pxMaxRight(double(tms_tile_id.coords.x + 1) * mGridSize, double(tms_tile_id.coords.y + 1) * mGridSize);

        // convert pixels to native coordinates
        const CRSPoint minLeft = pixelsToCrs(pxMinLeft, tms_tile_id.zoom_level);
        const CRSPoint maxRight = pixelsToCrs(pxMaxRight, tms_tile_id.zoom_level);

        return { minLeft, maxRight };
    }

    [[nodiscard]] const std::vector<tile::Id>& rootTiles() const {
        return this->mRootTiles;
    }

    /// Get the tile size associated with this grid
    [[nodiscard]] inline i_tile tileSize() const
    {
        return mGridSize;
    }

    /// Get the spatial reference system of this grid
    [[nodiscard]] inline const OGRSpatialReference& getSRS() const
    {
        return mSRS;
    }

    /// Get the extent covered by the grid in CRS coordinates
    [[nodiscard]] inline const tile::SrsBounds& getExtent() const
    {
        return mExtent;
    }

    [[nodiscard]] inline int getEpsgCode() const
    {
        return mEpsgCode;
    }

private:
    /// The tile size associated with this grid
    i_tile mGridSize;

    /// The area covered by the grid
    tile::SrsBounds mExtent;

    /// The spatial reference system covered by the grid
    OGRSpatialReference mSRS;
    int mEpsgCode = -1;

    double mInitialResolution; ///< The initial resolution of this particular profile
    double mXOriginShift; ///< The shift in CRS coordinates to get to the origin from minx
    double mYOriginShift; ///< The shift in CRS coordinates to get to the origin from miny

    /// By what factor will the scale increase at each zoom level?
    double mZoomFactor;

    /// A list of all the root tiles of the grid.
    std::vector<tile::Id> mRootTiles;
};

#endif /* CTBGRID_HPP */
