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

#include <catch2/catch.hpp>

#include "RetryPolicy.h"

using namespace std::literals;

TEST_CASE("retry policy backoff")
{
    const RetryPolicy policy;
    CHECK(policy.max_attempts == 5);
    CHECK(policy.backoff(0) == 0ms);
    CHECK(policy.backoff(1) == 500ms);
    CHECK(policy.backoff(2) == 1000ms);
    CHECK(policy.backoff(3) == 2000ms);
    CHECK(policy.backoff(4) == 4000ms);
    CHECK(policy.backoff(5) == 8000ms);
    CHECK(policy.backoff(6) == 10s);
    CHECK(policy.backoff(60) == 10s);

    const RetryPolicy constant { 3, 100ms, 1.0, 1s };
    CHECK(constant.backoff(1) == 100ms);
    CHECK(constant.backoff(3) == 100ms);
}
