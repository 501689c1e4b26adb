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

#include "BlankTileClassifier.h"

#include <utility>

PayloadSizeBlankTileClassifier::PayloadSizeBlankTileClassifier(std::set<std::size_t> blank_sizes)
    : m_blank_sizes(std::move(blank_sizes))
{
}

bool PayloadSizeBlankTileClassifier::isBlank(std::span<const uint8_t> payload) const
{
    return payload.empty() || m_blank_sizes.contains(payload.size());
}

const std::set<std::size_t>& PayloadSizeBlankTileClassifier::blankSizes() const
{
    return m_blank_sizes;
}
