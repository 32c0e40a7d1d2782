/**
 * @file ShutdownSignal.cpp
 * @brief Implementation of ShutdownSignal.
 */

#include "application/ShutdownSignal.hpp"
#include <algorithm>

namespace stablecopy::application {

void ShutdownSignal::requestStop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop.store(true, std::memory_order_release);
    }
    m_cv.notify_all();
}

void ShutdownSignal::notifyFromSignalHandler() {
    m_stop.store(true, std::memory_order_release);
}

bool ShutdownSignal::waitFor(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + std::min(timeout, kMaxWait);
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!stopRequested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice);
        m_cv.wait_for(lock, slice, [this] { return stopRequested(); });
    }
    return stopRequested();
}

} // namespace stablecopy::application
