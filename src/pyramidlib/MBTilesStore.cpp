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

#include "MBTilesStore.h"

#include <exception>
#include <utility>

#include <fmt/core.h>

#include "Exception.h"
#include "log.h"

void MBTilesStore::DatabaseDeleter::operator()(sqlite3* db) const noexcept
{
    if (db != nullptr)
        sqlite3_close(db);
}

void MBTilesStore::StatementDeleter::operator()(sqlite3_stmt* stmt) const noexcept
{
    if (stmt != nullptr)
        sqlite3_finalize(stmt);
}

MBTilesStore::MBTilesStore(const std::filesystem::path& path)
    : m_path(path)
{
    sqlite3* raw_db = nullptr;
    const auto open_result = sqlite3_open_v2(path.string().c_str(), &raw_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    m_db.reset(raw_db); // sqlite hands out a handle even on failure, it must be closed.
    if (open_result != SQLITE_OK) {
        const std::string message = raw_db ? sqlite3_errmsg(raw_db) : sqlite3_errstr(open_result);
        throw Exception(fmt::format("Could not open mbtiles file {}: {}", path.string(), message));
    }

    // tiles are written in large batches by a single writer, durability of a single batch does not matter.
    exec("PRAGMA journal_mode=MEMORY;");
    exec("PRAGMA synchronous=OFF;");
    exec("CREATE TABLE IF NOT EXISTS metadata (name TEXT, value TEXT);");
    exec("CREATE TABLE IF NOT EXISTS tiles (zoom_level INTEGER, tile_column INTEGER, tile_row INTEGER, tile_data BLOB);");
    exec("CREATE UNIQUE INDEX IF NOT EXISTS tiles_index ON tiles (zoom_level, tile_column, tile_row);");

    m_insert_tile = prepare("INSERT OR REPLACE INTO tiles (zoom_level, tile_column, tile_row, tile_data) VALUES (?1, ?2, ?3, ?4);");
    LOG_DEBUG("Opened mbtiles file {}", path.string());
}

MBTilesStore::~MBTilesStore()
{
    m_insert_tile.reset();
    if (m_in_transaction && m_db) {
        char* error = nullptr;
        if (sqlite3_exec(m_db.get(), "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
            LOG_ERROR("Rolling back the open transaction of {} failed: {}", m_path.string(), error ? error : "unknown error");
        }
        sqlite3_free(error);
    }
}

void MBTilesStore::check(int result_code, int expected, const char* what) const
{
    if (result_code != expected)
        throw Exception(fmt::format("mbtiles {}: {} failed: {}", m_path.string(), what, sqlite3_errmsg(m_db.get())));
}

void MBTilesStore::exec(const char* sql)
{
    char* error = nullptr;
    if (sqlite3_exec(m_db.get(), sql, nullptr, nullptr, &error) != SQLITE_OK) {
        const std::string message = error ? error : sqlite3_errmsg(m_db.get());
        sqlite3_free(error);
        throw Exception(fmt::format("mbtiles {}: '{}' failed: {}", m_path.string(), sql, message));
    }
}

MBTilesStore::Statement MBTilesStore::prepare(const char* sql) const
{
    sqlite3_stmt* raw_stmt = nullptr;
    const auto result = sqlite3_prepare_v2(m_db.get(), sql, -1, &raw_stmt, nullptr);
    Statement stmt(raw_stmt);
    check(result, SQLITE_OK, sql);
    return stmt;
}

void MBTilesStore::writeMetadata(const MBTilesMetadata& metadata)
{
    std::vector<std::pair<std::string, std::string>> entries = {
        { "name", metadata.name },
        { "format", metadata.format },
        { "minzoom", std::to_string(metadata.min_zoom) },
        { "maxzoom", std::to_string(metadata.max_zoom) },
        { "scheme", "tms" },
        { "type", metadata.type },
        { "version", "1.3" },
    };
    if (!metadata.description.empty())
        entries.emplace_back("description", metadata.description);
    if (metadata.bounds) {
        const auto& b = *metadata.bounds;
        entries.emplace_back("bounds", fmt::format("{:.7f},{:.7f},{:.7f},{:.7f}", b.min.x, b.min.y, b.max.x, b.max.y));
    }

    // metadata has no unique constraint in files written by other tools, keys are replaced by delete and insert.
    auto remove = prepare("DELETE FROM metadata WHERE name = ?1;");
    auto insert = prepare("INSERT INTO metadata (name, value) VALUES (?1, ?2);");
    exec("SAVEPOINT write_metadata;");
    try {
        for (const auto& [name, value] : entries) {
            check(sqlite3_bind_text(remove.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT), SQLITE_OK, "binding metadata name");
            check(sqlite3_step(remove.get()), SQLITE_DONE, "removing metadata");
            sqlite3_reset(remove.get());

            check(sqlite3_bind_text(insert.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT), SQLITE_OK, "binding metadata name");
            check(sqlite3_bind_text(insert.get(), 2, value.c_str(), -1, SQLITE_TRANSIENT), SQLITE_OK, "binding metadata value");
            check(sqlite3_step(insert.get()), SQLITE_DONE, "writing metadata");
            sqlite3_reset(insert.get());
        }
    } catch (const std::exception&) {
        if (sqlite3_exec(m_db.get(), "ROLLBACK TO write_metadata; RELEASE write_metadata;", nullptr, nullptr, nullptr) != SQLITE_OK)
            LOG_ERROR("Rolling back the metadata of {} failed: {}", m_path.string(), sqlite3_errmsg(m_db.get()));
        throw;
    }
    exec("RELEASE write_metadata;");
}

void MBTilesStore::beginTransaction()
{
    if (m_in_transaction)
        throw Exception("mbtiles: a transaction is already open");
    exec("BEGIN TRANSACTION;");
    m_in_transaction = true;
}

void MBTilesStore::commit()
{
    if (!m_in_transaction)
        throw Exception("mbtiles: commit without an open transaction");
    exec("COMMIT;");
    m_in_transaction = false;
}

void MBTilesStore::rollback()
{
    if (!m_in_transaction)
        return;
    m_in_transaction = false;
    exec("ROLLBACK;");
}

void MBTilesStore::putTile(const TileRecord& record)
{
    auto* stmt = m_insert_tile.get();
    check(sqlite3_bind_int64(stmt, 1, record.zoom), SQLITE_OK, "binding zoom_level");
    check(sqlite3_bind_int64(stmt, 2, record.column), SQLITE_OK, "binding tile_column");
    check(sqlite3_bind_int64(stmt, 3, record.row), SQLITE_OK, "binding tile_row");
    if (record.data.empty())
        check(sqlite3_bind_zeroblob(stmt, 4, 0), SQLITE_OK, "binding tile_data");
    else
        check(sqlite3_bind_blob(stmt, 4, record.data.data(), int(record.data.size()), SQLITE_STATIC), SQLITE_OK, "binding tile_data");

    const auto step_result = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    check(step_result, SQLITE_DONE, "inserting tile");
}

bool MBTilesStore::inTransaction() const
{
    return m_in_transaction;
}

const std::filesystem::path& MBTilesStore::path() const
{
    return m_path;
}

std::optional<std::vector<uint8_t>> MBTilesStore::tile(unsigned zoom, unsigned column, unsigned row) const
{
    auto stmt = prepare("SELECT tile_data FROM tiles WHERE zoom_level = ?1 AND tile_column = ?2 AND tile_row = ?3;");
    check(sqlite3_bind_int64(stmt.get(), 1, zoom), SQLITE_OK, "binding zoom_level");
    check(sqlite3_bind_int64(stmt.get(), 2, column), SQLITE_OK, "binding tile_column");
    check(sqlite3_bind_int64(stmt.get(), 3, row), SQLITE_OK, "binding tile_row");

    const auto result = sqlite3_step(stmt.get());
    if (result == SQLITE_DONE)
        return std::nullopt;
    check(result, SQLITE_ROW, "reading tile");

    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt.get(), 0));
    const auto size = sqlite3_column_bytes(stmt.get(), 0);
    if (data == nullptr || size <= 0)
        return std::vector<uint8_t>();
    return std::vector<uint8_t>(data, data + size);
}

std::size_t MBTilesStore::tileCount() const
{
    auto stmt = prepare("SELECT COUNT(*) FROM tiles;");
    check(sqlite3_step(stmt.get()), SQLITE_ROW, "counting tiles");
    return std::size_t(sqlite3_column_int64(stmt.get(), 0));
}

std::size_t MBTilesStore::tileCount(unsigned zoom) const
{
    auto stmt = prepare("SELECT COUNT(*) FROM tiles WHERE zoom_level = ?1;");
    check(sqlite3_bind_int64(stmt.get(), 1, zoom), SQLITE_OK, "binding zoom_level");
    check(sqlite3_step(stmt.get()), SQLITE_ROW, "counting tiles");
    return std::size_t(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<tile::Id> MBTilesStore::tileIds() const
{
    auto stmt = prepare("SELECT zoom_level, tile_column, tile_row FROM tiles ORDER BY zoom_level, tile_column, tile_row;");
    std::vector<tile::Id> ids;
    int result = SQLITE_ROW;
    while ((result = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ids.push_back({ unsigned(sqlite3_column_int64(stmt.get(), 0)),
            { unsigned(sqlite3_column_int64(stmt.get(), 1)), unsigned(sqlite3_column_int64(stmt.get(), 2)) },
            tile::Scheme::Tms });
    }
    check(result, SQLITE_DONE, "listing tiles");
    return ids;
}

std::map<std::string, std::string> MBTilesStore::metadata() const
{
    auto stmt = prepare("SELECT name, value FROM metadata;");
    std::map<std::string, std::string> entries;
    int result = SQLITE_ROW;
    while ((result = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const auto* name = sqlite3_column_text(stmt.get(), 0);
        const auto* value = sqlite3_column_text(stmt.get(), 1);
        if (name == nullptr)
            continue;
        entries[reinterpret_cast<const char*>(name)] = value ? reinterpret_cast<const char*>(value) : "";
    }
    check(result, SQLITE_DONE, "reading metadata");
    return entries;
}
