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

#include "BaseCoverTiler.h"

#include <algorithm>

#include "Exception.h"

BaseCoverTiler::BaseCoverTiler(const ctb::Grid& grid, const tile::SrsBounds& bounds, tile::Scheme scheme)
    : Tiler(grid, bounds, scheme)
{
}

// bounds lying exactly on a tile border must not pull in the neighbouring tile.
tile::Id BaseCoverTiler::southWestTile(unsigned zoom_level) const
{
    const auto epsilon = grid().resolution(zoom_level) / 100;
    const auto south_west = glm::dvec2(std::min(bounds().max.x, bounds().min.x + epsilon), std::min(bounds().max.y, bounds().min.y + epsilon));
    return grid().crsToTile(south_west, zoom_level).to(scheme());
}

tile::Id BaseCoverTiler::northEastTile(unsigned zoom_level) const
{
    const auto epsilon = grid().resolution(zoom_level) / 100;
    const auto north_east = glm::dvec2(std::max(bounds().min.x, bounds().max.x - epsilon), std::max(bounds().min.y, bounds().max.y - epsilon));
    return grid().crsToTile(north_east, zoom_level).to(scheme());
}

std::vector<tile::Id> BaseCoverTiler::generateTiles(unsigned zoom_level) const
{
    if (zoom_level >= 31)
        throw Exception(fmt::format("Zoom level {} is not supported", zoom_level));
    if (bounds().width() < 0 || bounds().height() < 0)
        return {}; // the bounds do not intersect the grid

    // in the tms scheme south west corresponds to the smaller numbers. hence we can iterate from sw to ne
    const auto sw = southWestTile(zoom_level).to(tile::Scheme::Tms).coords;
    const auto ne = northEastTile(zoom_level).to(tile::Scheme::Tms).coords;

    const auto n_tiles = size_t(ne.y - sw.y + 1) * size_t(ne.x - sw.x + 1);
    if (n_tiles >= 1'000'000'000)
        throw Exception(fmt::format("The base zoom level {} would generate {} tiles, choose a smaller minimum zoom level.", zoom_level, n_tiles));

    std::vector<tile::Id> tiles;
    tiles.reserve(n_tiles);
    for (auto ty = sw.y; ty <= ne.y; ++ty) {
        for (auto tx = sw.x; tx <= ne.x; ++tx) {
            tiles.push_back(tile::Id { zoom_level, { tx, ty }, tile::Scheme::Tms }.to(scheme()));
        }
    }

    return tiles;
}
