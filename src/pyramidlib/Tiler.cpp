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

#include "Tiler.h"

#include <utility>

Tiler::Tiler(ctb::Grid grid, const tile::SrsBounds& bounds, tile::Scheme scheme)
    : m_grid(std::move(grid))
    , m_scheme(scheme)
{
    setBounds(bounds);
}

const ctb::Grid& Tiler::grid() const
{
    return m_grid;
}

ctb::i_tile Tiler::tile_size() const
{
    return grid().tileSize();
}

tile::Descriptor Tiler::tile_for(const tile::Id& tile_id) const
{
    const tile::SrsBounds srs_bounds = grid().srsBounds(tile_id);
    return { tile_id, srs_bounds, grid().getEpsgCode(), tile_size() };
}

tile::Scheme Tiler::scheme() const
{
    return m_scheme;
}

const tile::SrsBounds& Tiler::bounds() const
{
    return m_bounds;
}

void Tiler::setBounds(const tile::SrsBounds& newBounds)
{
    // nothing outside the grid can be tiled.
    m_bounds = tile::intersection(newBounds, grid().getExtent());
}
