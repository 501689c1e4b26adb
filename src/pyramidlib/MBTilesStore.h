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

#ifndef MBTILESSTORE_H
#define MBTILESSTORE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "TileStore.h"
#include "tile.h"

struct MBTilesMetadata {
    std::string name;
    std::string format = "png";
    unsigned min_zoom = 0;
    unsigned max_zoom = 0;
    // west, south, east, north in degrees (wgs84)
    std::optional<tile::SrsBounds> bounds;
    std::string description;
    std::string type = "baselayer";
};

/// Tile store writing an MBTiles 1.3 sqlite file (https://github.com/mapbox/mbtiles-spec).
class MBTilesStore : public TileStore {
public:
    /// opens or creates the file and makes sure the schema exists.
    explicit MBTilesStore(const std::filesystem::path& path);
    ~MBTilesStore() override;

    MBTilesStore(const MBTilesStore&) = delete;
    MBTilesStore& operator=(const MBTilesStore&) = delete;

    /// replaces all metadata keys written by this tool, other keys are kept.
    void writeMetadata(const MBTilesMetadata& metadata);

    void beginTransaction() override;
    void commit() override;
    void rollback() override;
    void putTile(const TileRecord& record) override;

    [[nodiscard]] bool inTransaction() const;
    [[nodiscard]] const std::filesystem::path& path() const;

    // read back
    [[nodiscard]] std::optional<std::vector<uint8_t>> tile(unsigned zoom, unsigned column, unsigned row) const;
    [[nodiscard]] std::size_t tileCount() const;
    [[nodiscard]] std::size_t tileCount(unsigned zoom) const;
    /// all stored tiles, in the tms scheme.
    [[nodiscard]] std::vector<tile::Id> tileIds() const;
    [[nodiscard]] std::map<std::string, std::string> metadata() const;

private:
    struct DatabaseDeleter {
        void operator()(sqlite3* db) const noexcept;
    };
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const noexcept;
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    void exec(const char* sql);
    [[nodiscard]] Statement prepare(const char* sql) const;
    void check(int result_code, int expected, const char* what) const;

    std::filesystem::path m_path;
    std::unique_ptr<sqlite3, DatabaseDeleter> m_db;
    Statement m_insert_tile;
    bool m_in_transaction = false;
};

#endif // MBTILESSTORE_H
