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

#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <tuple>

#include <fmt/core.h>
#include <glm/glm.hpp>
#include <glm/vector_relational.hpp>

namespace tile {
/// A representation of an extent
template <class T>
class Aabb {
public:
    glm::tvec2<T> min = {};
    glm::tvec2<T> max = {};

    bool operator==(const Aabb<T>& other) const = default;

    T width() const { return max.x - min.x; }
    T height() const { return max.y - min.y; }

    bool contains_inclusive(const glm::tvec2<T>& point) const
    {
        return min.x <= point.x && point.x <= max.x && min.y <= point.y && point.y <= max.y;
    }
};
using SrsBounds = Aabb<double>;

template <typename T>
bool intersect(const Aabb<T>& a, const Aabb<T>& b)
{
    // http://stackoverflow.com/questions/306316/determine-if-two-rectangles-overlap-each-other
    return a.min.x <= b.max.x && b.min.x <= a.max.x && a.min.y <= b.max.y && b.min.y <= a.max.y;
}

template <typename T>
Aabb<T> intersection(const Aabb<T>& a, const Aabb<T>& b)
{
    Aabb<T> r;
    r.min.x = std::max(a.min.x, b.min.x);
    r.min.y = std::max(a.min.y, b.min.y);
    r.max.x = std::min(a.max.x, b.max.x);
    r.max.y = std::min(a.max.y, b.max.y);
    return r;
}

// The difference between TMS and slippyMap is whether y starts counting from the bottom (south) or top (north).
// https://www.maptiler.com/google-maps-coordinates-tile-bounds-projection/#1/-16.88/79.02
//
// The pyramid is fetched in slippy map coordinates, MBTiles stores rows in TMS.
enum class Scheme {
    Tms, // southern most tile is y = 0
    SlippyMap // aka Google, XYZ, webmap tiles; northern most tile is y = 0
};

struct Id {
    unsigned zoom_level = unsigned(-1);
    glm::uvec2 coords;
    Scheme scheme = Scheme::Tms;

    [[nodiscard]] Id to(Scheme new_scheme) const
    {
        if (scheme == new_scheme)
            return *this;

        const auto n_y_tiles = (1u << zoom_level);
        const auto coord_y = n_y_tiles - coords.y - 1;
        return { zoom_level, { coords.x, coord_y }, new_scheme };
    }
    [[nodiscard]] Id parent() const { return { zoom_level - 1, coords / 2u, scheme }; }
    [[nodiscard]] std::array<Id, 4> children() const
    {
        return {
            Id { zoom_level + 1, coords * 2u + glm::uvec2(0, scheme != Scheme::Tms), scheme },
            Id { zoom_level + 1, coords * 2u + glm::uvec2(1, scheme != Scheme::Tms), scheme },
            Id { zoom_level + 1, coords * 2u + glm::uvec2(0, scheme == Scheme::Tms), scheme },
            Id { zoom_level + 1, coords * 2u + glm::uvec2(1, scheme == Scheme::Tms), scheme }
        };
    }
    // number of tiles along one axis at this zoom level
    [[nodiscard]] unsigned n_tiles_per_axis() const { return 1u << zoom_level; }
    [[nodiscard]] bool is_valid() const { return zoom_level < 32 && coords.x < n_tiles_per_axis() && coords.y < n_tiles_per_axis(); }

    bool operator==(const Id& other) const { return other.coords == coords && other.scheme == scheme && other.zoom_level == zoom_level; };
    bool operator<(const Id& other) const { return std::tie(zoom_level, coords.x, coords.y, scheme) < std::tie(other.zoom_level, other.coords.x, other.coords.y, other.scheme); };

    struct Hasher {
        std::size_t operator()(const Id& id) const
        {
            std::size_t seed = std::hash<unsigned>()(id.zoom_level);
            seed ^= std::hash<unsigned>()(id.coords.x) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            seed ^= std::hash<unsigned>()(id.coords.y) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            seed ^= std::hash<int>()(int(id.scheme)) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            return seed;
        }
    };
};

inline std::string to_string(const Id& tile)
{
    return fmt::format("Tile[Zoom={}, X={}, Y={}, {}]", tile.zoom_level, tile.coords.x, tile.coords.y, tile.scheme == Scheme::Tms ? "tms" : "slippy map");
}

struct Descriptor {
    tile::Id id;

    // bounds of the tile in the grid srs
    SrsBounds srsBounds;
    int srs_epsg;

    unsigned tileSize;
};
}
