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

#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

#include <catch2/catch.hpp>

#include "BlankTileClassifier.h"

TEST_CASE("payload size blank tile classifier")
{
    SECTION("default sizes")
    {
        const PayloadSizeBlankTileClassifier classifier;
        CHECK(classifier.isBlank(std::vector<uint8_t>(776)));
        CHECK(classifier.isBlank(std::vector<uint8_t>(777)));
        CHECK(!classifier.isBlank(std::vector<uint8_t>(775)));
        CHECK(!classifier.isBlank(std::vector<uint8_t>(778)));
        CHECK(!classifier.isBlank(std::vector<uint8_t>(20000)));
    }
    SECTION("empty payloads are always blank")
    {
        CHECK(PayloadSizeBlankTileClassifier().isBlank({}));
        CHECK(PayloadSizeBlankTileClassifier(std::set<std::size_t> {}).isBlank({}));
    }
    SECTION("configured sizes")
    {
        const PayloadSizeBlankTileClassifier classifier(std::set<std::size_t> { 100 });
        CHECK(classifier.blankSizes().size() == 1);
        CHECK(classifier.isBlank(std::vector<uint8_t>(100)));
        CHECK(!classifier.isBlank(std::vector<uint8_t>(776)));
    }
}
