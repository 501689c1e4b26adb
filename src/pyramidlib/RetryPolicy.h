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

#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include <chrono>

struct RetryPolicy {
    unsigned max_attempts = 5;
    std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(500);
    double backoff_factor = 2.0;
    std::chrono::milliseconds max_backoff = std::chrono::seconds(10);

    /// delay before the next attempt, after failed_attempts attempts failed (>= 1).
    [[nodiscard]] std::chrono::milliseconds backoff(unsigned failed_attempts) const;
};

#endif // RETRYPOLICY_H
