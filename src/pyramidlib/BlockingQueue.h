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

#ifndef BLOCKINGQUEUE_H
#define BLOCKINGQUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

/// A closable FIFO shared between threads.
///
/// capacity == 0 means unbounded. push() blocks while the queue is full, pop() blocks while
/// it is empty. After close() push() refuses new items, pop() still hands out the remaining
/// items and returns std::nullopt once the queue is drained.
template <typename T>
class BlockingQueue {
public:
    explicit BlockingQueue(std::size_t capacity = 0)
        : m_capacity(capacity)
    {
    }

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;
    BlockingQueue(BlockingQueue&&) = delete;
    BlockingQueue& operator=(BlockingQueue&&) = delete;

    /// returns false if the queue was closed, the item is dropped in that case.
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock { m_mutex };
        m_not_full.wait(lock, [this] { return m_closed || m_capacity == 0 || m_items.size() < m_capacity; });
        if (m_closed)
            return false;

        m_items.push_back(std::move(item));
        m_not_empty.notify_one();
        return true;
    }

    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock { m_mutex };
        m_not_empty.wait(lock, [this] { return m_closed || !m_items.empty(); });
        if (m_items.empty())
            return std::nullopt;

        std::optional<T> item { std::move(m_items.front()) };
        m_items.pop_front();
        m_not_full.notify_one();
        return item;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock { m_mutex };
            m_closed = true;
        }
        m_not_empty.notify_all();
        m_not_full.notify_all();
    }

    [[nodiscard]] bool closed() const
    {
        std::lock_guard<std::mutex> lock { m_mutex };
        return m_closed;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> lock { m_mutex };
        return m_items.size();
    }

    [[nodiscard]] std::size_t capacity() const { return m_capacity; }

private:
    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_not_full;
    std::deque<T> m_items;
    bool m_closed = false;
};

#endif // BLOCKINGQUEUE_H
