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

#pragma once

#include <vector>

#include "Tiler.h"

/// Computes the set of tiles of one zoom level that cover the tiler bounds.
/// These are the seeds of the pyramid, everything below is found by subdivision.
class BaseCoverTiler : public Tiler {
public:
    BaseCoverTiler(const ctb::Grid& grid, const tile::SrsBounds& bounds, tile::Scheme scheme);

    [[nodiscard]] std::vector<tile::Id> generateTiles(unsigned zoom_level) const;

    [[nodiscard]] tile::Id southWestTile(unsigned zoom_level) const;
    [[nodiscard]] tile::Id northEastTile(unsigned zoom_level) const;
};
