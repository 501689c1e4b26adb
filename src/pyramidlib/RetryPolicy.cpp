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

#include "RetryPolicy.h"

#include <algorithm>
#include <cmath>

std::chrono::milliseconds RetryPolicy::backoff(unsigned failed_attempts) const
{
    if (failed_attempts == 0)
        return std::chrono::milliseconds(0);
    const auto delay = double(initial_backoff.count()) * std::pow(backoff_factor, double(failed_attempts - 1));
    const auto capped = std::min(delay, double(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}
