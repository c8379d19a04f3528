// =================================================================
// include/Parley/BoundedChannel.hpp
// =================================================================
// Fixed-capacity blocking queue connecting pipeline stages.

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace Parley {

/**
 * @brief Bounded FIFO channel with backpressure
 *
 * push() blocks while the channel is full; pop() blocks while it is empty.
 * After close() pushes are refused and pop() drains what is left, then
 * returns std::nullopt.
 */
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity)
        : m_capacity(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /**
     * @brief Push an item, waiting for space
     * @return False if the channel was closed
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_full.wait(lock, [this]() { return m_closed || m_items.size() < m_capacity; });
        if (m_closed) {
            return false;
        }
        m_items.push_back(std::move(item));
        lock.unlock();
        m_not_empty.notify_one();
        return true;
    }

    /**
     * @brief Push without waiting
     * @return False if the channel is full or closed
     */
    bool tryPush(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_closed || m_items.size() >= m_capacity) {
            return false;
        }
        m_items.push_back(std::move(item));
        lock.unlock();
        m_not_empty.notify_one();
        return true;
    }

    /**
     * @brief Pop the oldest item, waiting for one
     * @return std::nullopt once the channel is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait(lock, [this]() { return m_closed || !m_items.empty(); });
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
     * @brief Pop the oldest item, waiting at most `timeout`
     * @return std::nullopt on timeout or once closed and drained
     */
    template <typename Rep, typename Period>
    std::optional<T> popFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait_for(lock, timeout, [this]() { return m_closed || !m_items.empty(); });
        if (m_items.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_items.front());
        m_items.pop_front();
        lock.unlock();
        m_not_full.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_not_empty.notify_all();
        m_not_full.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    /**
     * @brief True once closed with nothing left to pop
     */
    bool isDrained() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed && m_items.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_capacity; }

private:
    const size_t m_capacity;
    std::deque<T> m_items;
    bool m_closed = false;
    mutable std::mutex m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_not_full;
};

} // namespace Parley
