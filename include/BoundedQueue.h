/*
 * BoundedQueue.h - Thread-safe bounded queue with blocking hand-off
 * This file is part of IcyRec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * IcyRec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef BOUNDEDQUEUE_H
#define BOUNDEDQUEUE_H

// No direct includes - all includes should be in icyrec.h

/**
 * @brief Thread-safe bounded FIFO queue
 *
 * Producers block in push() while the queue holds max_items entries;
 * consumers block in pop() while it is empty. close() wakes everybody:
 * further pushes are refused, pops drain what is left and then fail.
 */
template<typename T>
class BoundedQueue {
public:
    /**
     * @brief Constructor
     * @param max_items Maximum number of items (0 = unlimited)
     */
    explicit BoundedQueue(size_t max_items = 0)
        : m_max_items(max_items)
        , m_closed(false) {
    }

    ~BoundedQueue() = default;

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push an item, waiting for room if the queue is full
     * @param item Item to push
     * @return true if item was queued, false if the queue was closed
     */
    bool push(T&& item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_full.wait(lock, [this] { return m_closed || !full_unlocked(); });
        if (m_closed) {
            return false;
        }
        m_queue.push(std::move(item));
        m_not_empty.notify_one();
        return true;
    }

    /**
     * @brief Pop an item, waiting until one is available
     * @param item Reference to store the popped item
     * @return true if item was popped, false if the queue is closed and drained
     */
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait(lock, [this] { return m_closed || !m_queue.empty(); });
        if (m_queue.empty()) {
            return false;
        }
        item = std::move(m_queue.front());
        m_queue.pop();
        m_not_full.notify_one();
        return true;
    }

    /**
     * @brief Refuse further pushes and wake all waiters
     */
    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_not_empty.notify_all();
        m_not_full.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    bool full_unlocked() const {
        return m_max_items > 0 && m_queue.size() >= m_max_items;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_not_full;
    std::queue<T> m_queue;
    size_t m_max_items;
    bool m_closed;
};

#endif // BOUNDEDQUEUE_H
