/**
 * @file ShutdownSignal.hpp
 * @brief Cancellation token with an interruptible wait.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace stablecopy::application {

/**
 * @class ShutdownSignal
 * @brief One-shot stop flag shared between the poll loop and whoever ends it.
 *
 * requestStop() wakes waiters immediately. notifyFromSignalHandler() only sets
 * the flag (async-signal-safe); waiters notice it within one wait slice.
 */
class ShutdownSignal {
public:
    static constexpr std::chrono::milliseconds kWaitSlice{1000};
    /// Longer timeouts are shortened to this so the steady_clock deadline cannot overflow.
    static constexpr std::chrono::milliseconds kMaxWait{std::chrono::hours(24 * 365 * 100)};

    ShutdownSignal() = default;
    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    /** @brief Sets the flag and wakes every waiter. */
    void requestStop();

    /** @brief Sets the flag without locking or notifying. Safe inside a signal handler. */
    void notifyFromSignalHandler();

    bool stopRequested() const { return m_stop.load(std::memory_order_acquire); }

    /**
     * @brief Sleeps up to @p timeout (at most kMaxWait), returning early when stop is requested.
     * @return True if stop was requested.
     */
    bool waitFor(std::chrono::milliseconds timeout);

private:
    std::atomic<bool> m_stop{false};
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace stablecopy::application
