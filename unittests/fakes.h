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

#ifndef UNITTESTS_FAKES_H
#define UNITTESTS_FAKES_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <fmt/core.h>

#include "Exception.h"
#include "TileImageSource.h"
#include "TileStore.h"
#include "tile.h"

namespace fakes {

inline TileImage payload_for(const tile::Id& tile)
{
    const auto text = tile::to_string(tile);
    return TileImage(text.begin(), text.end());
}

inline TileImage blank_payload()
{
    return TileImage(776, 0);
}

/// deterministic in memory image service.
class TileImageSource : public ::TileImageSource {
public:
    std::function<bool(const tile::Id&)> is_blank = [](const tile::Id&) { return false; };
    // number of failing attempts before a tile is delivered
    std::function<unsigned(const tile::Id&)> failures = [](const tile::Id&) { return 0u; };
    // number of attempts throwing an exception instead of returning
    std::function<unsigned(const tile::Id&)> throwing = [](const tile::Id&) { return 0u; };

    [[nodiscard]] tl::expected<TileImage, FetchError> fetch(const tile::Id& tile) const override
    {
        unsigned call = 0;
        {
            std::scoped_lock lock { m_mutex };
            call = ++m_calls[tile];
        }
        if (call <= throwing(tile))
            throw Exception(fmt::format("attempt {} threw", call));
        if (call <= failures(tile))
            return tl::unexpected(FetchError(FetchErrorKind::Transport, fmt::format("attempt {} failed", call)));
        if (is_blank(tile))
            return blank_payload();
        return payload_for(tile);
    }

    [[nodiscard]] unsigned calls(const tile::Id& tile) const
    {
        std::scoped_lock lock { m_mutex };
        const auto it = m_calls.find(tile);
        return it == m_calls.end() ? 0 : it->second;
    }

    [[nodiscard]] std::size_t totalCalls() const
    {
        std::scoped_lock lock { m_mutex };
        std::size_t total = 0;
        for (const auto& [tile, n] : m_calls)
            total += n;
        return total;
    }

private:
    mutable std::mutex m_mutex;
    mutable std::map<tile::Id, unsigned> m_calls;
};

/// transactional store in memory. pending rows become visible on commit.
class TileStore : public ::TileStore {
public:
    using Key = std::tuple<unsigned, unsigned, unsigned>;

    // putTile throws once this many tiles were put
    std::optional<std::size_t> fail_after_puts;

    void beginTransaction() override
    {
        if (m_in_transaction)
            throw Exception("transaction already open");
        m_in_transaction = true;
    }
    void commit() override
    {
        if (!m_in_transaction)
            throw Exception("no open transaction");
        for (auto& [key, data] : m_pending)
            m_committed[key] = std::move(data);
        m_pending.clear();
        m_in_transaction = false;
        ++m_commits;
    }
    void rollback() override
    {
        m_pending.clear();
        m_in_transaction = false;
        ++m_rollbacks;
    }
    void putTile(const TileRecord& record) override
    {
        if (!m_in_transaction)
            throw Exception("put outside of a transaction");
        if (fail_after_puts && m_puts >= *fail_after_puts)
            throw Exception("disk full");
        ++m_puts;
        m_pending[{ record.zoom, record.column, record.row }] = std::vector<uint8_t>(record.data.begin(), record.data.end());
    }

    [[nodiscard]] const std::map<Key, std::vector<uint8_t>>& committed() const { return m_committed; }
    [[nodiscard]] std::size_t commits() const { return m_commits; }
    [[nodiscard]] std::size_t rollbacks() const { return m_rollbacks; }
    [[nodiscard]] bool inTransaction() const { return m_in_transaction; }
    [[nodiscard]] std::size_t count(unsigned zoom) const
    {
        std::size_t n = 0;
        for (const auto& [key, data] : m_committed)
            n += std::get<0>(key) == zoom;
        return n;
    }

private:
    std::map<Key, std::vector<uint8_t>> m_pending;
    std::map<Key, std::vector<uint8_t>> m_committed;
    bool m_in_transaction = false;
    std::size_t m_puts = 0;
    std::size_t m_commits = 0;
    std::size_t m_rollbacks = 0;
};

/// sqlite file in the temp directory, removed again on destruction.
class TemporaryFile {
public:
    explicit TemporaryFile(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / fmt::format("apb_unittest_{}.mbtiles", name))
    {
        std::filesystem::remove(m_path);
    }
    ~TemporaryFile()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }
    TemporaryFile(const TemporaryFile&) = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

}

#endif // UNITTESTS_FAKES_H
