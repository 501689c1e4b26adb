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

#include <cstdint>
#include <filesystem>
#include <vector>

#include <sqlite3.h>

#include "catch2_helpers.h"

#include "Exception.h"
#include "MBTilesStore.h"
#include "fakes.h"

namespace {
void execute(const std::filesystem::path& path, const char* sql)
{
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
    CHECK(sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);
}

int count_rows(const std::filesystem::path& path, const char* sql)
{
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    REQUIRE(sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK);
    REQUIRE(sqlite3_step(stmt) == SQLITE_ROW);
    const int count = sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return count;
}

std::vector<uint8_t> bytes(std::initializer_list<uint8_t> values)
{
    return std::vector<uint8_t>(values);
}
}

TEST_CASE("mbtiles store")
{
    const fakes::TemporaryFile file("store");

    SECTION("tiles are visible after commit")
    {
        MBTilesStore store(file.path());
        CHECK(store.tileCount() == 0);
        store.beginTransaction();
        CHECK(store.inTransaction());
        const auto a = bytes({ 1, 2, 3 });
        const auto b = bytes({ 4, 5 });
        store.putTile({ 12, 2234, 2675, a });
        store.putTile({ 13, 4468, 5351, b });
        store.commit();
        CHECK(!store.inTransaction());

        CHECK(store.tileCount() == 2);
        CHECK(store.tileCount(12) == 1);
        CHECK(store.tileCount(14) == 0);
        CHECK(store.tile(12, 2234, 2675) == a);
        CHECK(store.tile(13, 4468, 5351) == b);
        CHECK(store.tile(12, 0, 0) == std::nullopt);
        CHECK(store.tileIds() == std::vector<tile::Id> { { 12, { 2234, 2675 }, tile::Scheme::Tms }, { 13, { 4468, 5351 }, tile::Scheme::Tms } });
    }

    SECTION("the last write of a tile wins")
    {
        MBTilesStore store(file.path());
        const auto first = bytes({ 1 });
        const auto second = bytes({ 2, 2 });
        store.beginTransaction();
        store.putTile({ 5, 1, 1, first });
        store.putTile({ 5, 1, 1, second });
        store.commit();
        store.beginTransaction();
        const auto third = bytes({ 3, 3, 3 });
        store.putTile({ 5, 1, 1, third });
        store.commit();
        CHECK(store.tileCount() == 1);
        CHECK(store.tile(5, 1, 1) == third);
    }

    SECTION("rollback discards the open batch only")
    {
        MBTilesStore store(file.path());
        const auto data = bytes({ 7 });
        store.beginTransaction();
        store.putTile({ 1, 0, 0, data });
        store.commit();
        store.beginTransaction();
        store.putTile({ 1, 1, 0, data });
        store.rollback();
        CHECK(store.tileCount() == 1);
        CHECK(store.tile(1, 1, 0) == std::nullopt);
    }

    SECTION("an open transaction is rolled back on destruction")
    {
        const auto data = bytes({ 7 });
        {
            MBTilesStore store(file.path());
            store.beginTransaction();
            store.putTile({ 1, 0, 0, data });
            store.commit();
            store.beginTransaction();
            store.putTile({ 1, 1, 1, data });
        }
        const MBTilesStore reopened(file.path());
        CHECK(reopened.tileCount() == 1);
    }

    SECTION("empty payloads are stored as empty blobs")
    {
        MBTilesStore store(file.path());
        store.beginTransaction();
        store.putTile({ 0, 0, 0, {} });
        store.commit();
        CHECK(store.tile(0, 0, 0) == std::vector<uint8_t>());
    }

    SECTION("metadata")
    {
        MBTilesStore store(file.path());
        MBTilesMetadata metadata;
        metadata.name = "orthophoto";
        metadata.min_zoom = 12;
        metadata.max_zoom = 20;
        metadata.bounds = tile::SrsBounds { { 9.5, 46.3 }, { 17.2, 49.1 } };
        metadata.description = "https://example.com/arcgis/rest/services/Ortho/ImageServer";
        store.writeMetadata(metadata);

        auto values = store.metadata();
        CHECK(values.at("name") == "orthophoto");
        CHECK(values.at("format") == "png");
        CHECK(values.at("minzoom") == "12");
        CHECK(values.at("maxzoom") == "20");
        CHECK(values.at("scheme") == "tms");
        CHECK(values.at("type") == "baselayer");
        CHECK(values.at("bounds") == "9.5000000,46.3000000,17.2000000,49.1000000");
        CHECK(values.at("description") == metadata.description);

        metadata.name = "renamed";
        metadata.max_zoom = 18;
        store.writeMetadata(metadata);
        values = store.metadata();
        CHECK(values.at("name") == "renamed");
        CHECK(values.at("maxzoom") == "18");
        CHECK(values.size() == 9);
    }

    SECTION("metadata of files with duplicate keys")
    {
        execute(file.path(),
            "CREATE TABLE metadata (name TEXT, value TEXT);"
            "INSERT INTO metadata VALUES ('name', 'first'), ('name', 'second'), ('attribution', 'a'), ('attribution', 'b');");

        MBTilesStore store(file.path());
        MBTilesMetadata metadata;
        metadata.name = "orthophoto";
        store.writeMetadata(metadata);

        CHECK(store.metadata().at("name") == "orthophoto");
        CHECK(count_rows(file.path(), "SELECT COUNT(*) FROM metadata WHERE name = 'name';") == 1);
        CHECK(count_rows(file.path(), "SELECT COUNT(*) FROM metadata WHERE name = 'attribution';") == 2);
    }

    SECTION("reopening keeps the data and the schema")
    {
        const auto data = bytes({ 1, 2 });
        {
            MBTilesStore store(file.path());
            store.beginTransaction();
            store.putTile({ 3, 2, 1, data });
            store.commit();
        }
        MBTilesStore store(file.path());
        CHECK(store.tile(3, 2, 1) == data);
    }

    SECTION("transaction misuse and unopenable files throw")
    {
        MBTilesStore store(file.path());
        CHECK_THROWS_AS(store.commit(), Exception);
        store.beginTransaction();
        CHECK_THROWS_AS(store.beginTransaction(), Exception);
        store.rollback();

        CHECK_THROWS_AS(MBTilesStore(file.path().parent_path() / "does" / "not" / "exist.mbtiles"), Exception);
    }
}
