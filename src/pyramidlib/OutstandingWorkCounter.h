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

#ifndef OUTSTANDINGWORKCOUNTER_H
#define OUTSTANDINGWORKCOUNTER_H

#include <atomic>
#include <cstddef>

/// Counts fetch tasks that were enqueued but whose result was not yet fully processed.
/// add() must be called before a task is pushed, completeOne() after the writer handled the
/// result including the enqueueing of its children. Zero therefore means: no task is queued,
/// no worker is fetching and no result is waiting.
class OutstandingWorkCounter {
    std::atomic<std::size_t> m_count = 0;

public:
    void add(std::size_t n_tasks = 1);
    /// returns true if this completed the last outstanding task.
    [[nodiscard]] bool completeOne();
    [[nodiscard]] std::size_t count() const;
};

#endif // OUTSTANDINGWORKCOUNTER_H
