#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace netsweep::scanner
{
    // Many producers, one consumer. Workers push finished items; the owner pops them in completion order.
    template <typename T>
    class CompletionChannel
    {
    private:
        std::queue<T> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_closed = false;

    public:
        void Push(T value)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_closed)
                    return;
                m_queue.push(std::move(value));
            }
            m_cv.notify_one();
        }

        // Blocks until an item is available. Returns nullopt once the channel is closed and drained.
        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return !m_queue.empty() || m_closed; });

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        // Like Pop, but gives up after wait. nullopt then means either the wait ran out or the channel
        // is closed and drained; Closed() tells the two apart.
        std::optional<T> PopFor(std::chrono::milliseconds wait)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_cv.wait_for(lock, wait, [this]
                               { return !m_queue.empty() || m_closed; }))
                return std::nullopt;

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        bool Closed() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_closed;
        }

        void Close()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
            }
            m_cv.notify_all();
        }
    };
}
