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

#include "OutstandingWorkCounter.h"

#include "Exception.h"

void OutstandingWorkCounter::add(std::size_t n_tasks)
{
    m_count += n_tasks;
}

bool OutstandingWorkCounter::completeOne()
{
    auto current = m_count.load();
    do {
        if (current == 0)
            throw Exception("More tasks completed than were enqueued.");
    } while (!m_count.compare_exchange_weak(current, current - 1));
    return current == 1;
}

std::size_t OutstandingWorkCounter::count() const
{
    return m_count.load();
}
