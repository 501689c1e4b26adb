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

#ifndef TILEIMAGESOURCE_H
#define TILEIMAGESOURCE_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <tl/expected.hpp>

#include "tile.h"

enum class FetchErrorKind {
    Timeout,
    Transport,
    HttpStatus,
    ServiceError,
    MalformedResponse,
    InvalidTile,
    Cancelled,
    SourceException
};

/// Recoverable failure of a single tile request. Retried by the worker pool, never fatal for the pipeline.
class FetchError {
public:
    FetchError() = default;
    FetchError(FetchErrorKind kind, std::string message = {})
        : m_kind(kind)
        , m_message(std::move(message))
    {
    }

    operator FetchErrorKind() const { return m_kind; }
    [[nodiscard]] FetchErrorKind kind() const { return m_kind; }
    [[nodiscard]] const std::string& message() const { return m_message; }

    bool operator==(FetchErrorKind other) const { return m_kind == other; }
    bool operator!=(FetchErrorKind other) const { return m_kind != other; }

    [[nodiscard]] std::string description() const
    {
        const auto kind_text = [this]() -> std::string {
            switch (m_kind) {
            case FetchErrorKind::Timeout:
                return "request timed out";
            case FetchErrorKind::Transport:
                return "transport error";
            case FetchErrorKind::HttpStatus:
                return "http error status";
            case FetchErrorKind::ServiceError:
                return "service reported an error";
            case FetchErrorKind::MalformedResponse:
                return "malformed response";
            case FetchErrorKind::InvalidTile:
                return "invalid tile";
            case FetchErrorKind::Cancelled:
                return "cancelled";
            case FetchErrorKind::SourceException:
                return "tile source threw";
            default:
                return "undefined error";
            }
        }();
        if (m_message.empty())
            return kind_text;
        return fmt::format("{}: {}", kind_text, m_message);
    }

private:
    FetchErrorKind m_kind = FetchErrorKind::Transport;
    std::string m_message;
};

using TileImage = std::vector<uint8_t>;

struct FetchResult {
    tile::Id tile;
    tl::expected<TileImage, FetchError> image;
    unsigned attempts = 0;

    [[nodiscard]] bool failed() const { return !image.has_value(); }
};

/// Produces the encoded image of one tile. Implementations are called concurrently from all workers.
class TileImageSource {
public:
    virtual ~TileImageSource() = default;
    [[nodiscard]] virtual tl::expected<TileImage, FetchError> fetch(const tile::Id& tile) const = 0;
};

#endif // TILEIMAGESOURCE_H
