// =================================================================
// include/Parley/CancellationToken.hpp
// =================================================================
// Per-call cancellation signal shared by every task of one call.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace Parley {

/**
 * @brief Cooperative cancellation flag with interruptible waits
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Cancel and wake every waiter; later calls have no effect
     */
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    bool isCancelled() const { return m_cancelled.load(); }

    /**
     * @brief Sleep for a duration unless cancelled first
     * @return True if the token was cancelled
     */
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, duration, [this]() { return m_cancelled.load(); });
    }

private:
    std::atomic<bool> m_cancelled{false};
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace Parley
