// =================================================================
// include/Repolens/BoundedQueue.hpp
// =================================================================
// Thread-safe FIFO with a fixed capacity and close() semantics.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace Repolens {

/**
 * @brief Multi-producer / multi-consumer queue with backpressure
 *
 * - push() blocks while the queue is full, so producers can never run
 *   more than `capacity` items ahead of the consumers.
 * - pop() blocks until an item is available, or returns std::nullopt once
 *   the queue is closed and drained.
 * - close() wakes every waiter; no push succeeds afterwards.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : m_capacity(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be at least 1");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Append an item, waiting for space if the queue is full
     * @return false if the queue was closed (the item is dropped)
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_full.wait(lock, [this] { return m_closed || m_items.size() < m_capacity; });
        if (m_closed) {
            return false;
        }
        m_items.push_back(std::move(item));
        lock.unlock();
        m_not_empty.notify_one();
        return true;
    }

    /**
     * @brief Remove the oldest item, waiting if necessary
     * @return The item, or std::nullopt once closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait(lock, [this] { return m_closed || !m_items.empty(); });
        if (m_items.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_items.front());
        m_items.pop_front();
        lock.unlock();
        m_not_full.notify_one();
        return item;
    }

    /**
     * @brief Stop accepting items and wake all waiting threads
     *
     * Items already queued can still be popped. Calling close() more than
     * once has no further effect.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_not_empty.notify_all();
        m_not_full.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_capacity; }

private:
    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_not_full;
    std::deque<T> m_items;
    bool m_closed = false;
};

} // namespace Repolens
