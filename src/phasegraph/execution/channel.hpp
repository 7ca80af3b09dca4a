/**
 * @file channel.hpp
 * @brief Blocking multi-producer, multi-consumer queue.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>

namespace phasegraph
{

/**
 * @brief Unbounded FIFO channel connecting the coordinator and its workers.
 *
 * @details
 * After `close()`, pushes are rejected and pops drain the remaining items
 * before reporting end of stream with `std::nullopt`.
 *
 * @par Thread Safety
 * - All member functions may be called concurrently.
 */
template <typename T>
class Channel
{
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @return False if the channel is closed; the value is dropped.
     */
    bool push(T value)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed)
            {
                return false;
            }
            m_items.push_back(std::move(value));
        }
        m_cv.notify_one();
        return true;
    }

    /**
     * @brief Block until an item arrives or the channel is closed and drained.
     */
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return !m_items.empty() || m_closed; });
        return take(lock);
    }

    /**
     * @brief Like `pop()`, but gives up at `deadline`.
     */
    template <typename Clock, typename Duration>
    std::optional<T> pop_until(const std::chrono::time_point<Clock, Duration>& deadline)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_until(lock, deadline, [this] { return !m_items.empty() || m_closed; });
        return take(lock);
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    std::optional<T> take(std::unique_lock<std::mutex>&)
    {
        if (m_items.empty())
        {
            return std::nullopt;
        }
        T value = std::move(m_items.front());
        m_items.pop_front();
        return value;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_items;
    bool m_closed{false};
};

} // namespace phasegraph
