#pragma once
/**
 * @file cancellation.hpp
 * @brief Interruptible timer waits driven by std::stop_token.
 * @note Every polling task suspends only here or inside a device call.
 */

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace rmon::core {

/**
 * @brief Sleep until @p deadline or until @p st is stopped.
 * @return true if the deadline was reached, false on cancellation.
 */
template <class Clock, class Duration>
bool sleep_until(std::stop_token st, std::chrono::time_point<Clock, Duration> deadline) {
    if (st.stop_requested()) return false;
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(m);
    // Predicate stays false: wake only on stop or timeout.
    cv.wait_until(lk, st, deadline, [] { return false; });
    return !st.stop_requested();
}

template <class Rep, class Period>
bool sleep_for(std::stop_token st, std::chrono::duration<Rep, Period> d) {
    return sleep_until(std::move(st), std::chrono::steady_clock::now() + d);
}

} // namespace rmon::core
