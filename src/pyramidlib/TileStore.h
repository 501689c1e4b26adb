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

#ifndef TILESTORE_H
#define TILESTORE_H

#include <cstdint>
#include <span>

#include "tile.h"

/// One row of the tiles table. The row is counted in the tms scheme (y = 0 is the southern most row).
struct TileRecord {
    unsigned zoom = 0;
    unsigned column = 0;
    unsigned row = 0;
    std::span<const uint8_t> data;
};

[[nodiscard]] inline TileRecord make_tile_record(const tile::Id& tile, std::span<const uint8_t> data)
{
    const auto tms = tile.to(tile::Scheme::Tms);
    return { tms.zoom_level, tms.coords.x, tms.coords.y, data };
}

/// Transactional tile sink. Only used from a single thread. All methods throw Exception on failure.
class TileStore {
public:
    virtual ~TileStore() = default;

    virtual void beginTransaction() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
    /// inserts or replaces the tile at (zoom, column, row).
    virtual void putTile(const TileRecord& record) = 0;
};

#endif // TILESTORE_H
