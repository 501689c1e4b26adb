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

#ifndef BLANKTILECLASSIFIER_H
#define BLANKTILECLASSIFIER_H

#include <cstddef>
#include <cstdint>
#include <set>
#include <span>

/// Decides whether a fetched tile carries no data. Blank tiles are neither stored nor subdivided.
class BlankTileClassifier {
public:
    virtual ~BlankTileClassifier() = default;
    [[nodiscard]] virtual bool isBlank(std::span<const uint8_t> payload) const = 0;
};

/// ArcGIS encodes a 256x256 png filled with the no data value into 776 or 777 bytes. Matching on the
/// payload size avoids decoding every image, but it is a heuristic and breaks for other tile sizes or formats.
class PayloadSizeBlankTileClassifier : public BlankTileClassifier {
public:
    explicit PayloadSizeBlankTileClassifier(std::set<std::size_t> blank_sizes = { 776, 777 });

    [[nodiscard]] bool isBlank(std::span<const uint8_t> payload) const override;
    [[nodiscard]] const std::set<std::size_t>& blankSizes() const;

private:
    std::set<std::size_t> m_blank_sizes;
};

#endif // BLANKTILECLASSIFIER_H
