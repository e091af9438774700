#pragma once
/**
 * @file async_publisher.hpp
 * @brief Non-blocking outbound event queue drained into an EventSink by one worker thread.
 * @details Polling loops call enqueue() and never wait on the sink. A full queue drops the
 *          new event (counted); sink failures are logged and counted, never propagated.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

#include "rmon/compat/expected.hpp"
#include "rmon/config/constants.hpp"
#include "rmon/core/setup_error.hpp"
#include "rmon/events/event.hpp"
#include "rmon/obs/observability.hpp"

namespace rmon::events {

using rmon::core::SetupError;

/** @class AsyncEventPublisher
 *  @brief Outbound event queue with a dedicated delivery thread.
 */
class AsyncEventPublisher final {
public:
    /**
     * @brief Factory: validates the sink and starts the worker.
     * @param sink Destination; must not be null.
     * @param capacity Queue bound (0 is rejected).
     * @param observer Counter sink; null selects obs::default_observer().
     */
    static rmon_detail::expected<std::shared_ptr<AsyncEventPublisher>, SetupError>
    create(std::shared_ptr<EventSink> sink,
           std::size_t capacity = rmon::config::constants::EVENT_QUEUE_CAPACITY,
           std::shared_ptr<rmon::obs::Observer> observer = nullptr);

    AsyncEventPublisher(const AsyncEventPublisher&)            = delete;
    AsyncEventPublisher& operator=(const AsyncEventPublisher&) = delete;
    ~AsyncEventPublisher();

    /**
     * @brief Queue an event for delivery; never blocks on the sink.
     * @return false if the queue was full or the publisher is stopped (event dropped).
     */
    bool enqueue(Event e);

    /// Deliver what is queued, then stop the worker. Idempotent.
    void stop();

    /// Events waiting for delivery.
    std::size_t pending() const;

    /// Events handed to the sink (successful or not).
    uint64_t delivered() const noexcept { return delivered_.load(std::memory_order_relaxed); }
    /// Sink failures.
    uint64_t failed() const noexcept { return failed_.load(std::memory_order_relaxed); }
    /// Events dropped because the queue was full or stopped.
    uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    AsyncEventPublisher(std::shared_ptr<EventSink> sink, std::size_t capacity,
                        std::shared_ptr<rmon::obs::Observer> observer);

    void run(std::stop_token st);
    void deliver(const Event& e);

    std::shared_ptr<EventSink>           sink_;
    std::shared_ptr<rmon::obs::Observer> obs_;
    const std::size_t                    capacity_;

    mutable std::mutex          mu_;
    std::condition_variable_any cv_;
    std::deque<Event>           queue_;
    bool                        stopped_{false};

    std::atomic<uint64_t> delivered_{0}, failed_{0}, dropped_{0};

    std::jthread worker_; ///< Last member: starts after everything above is constructed
};

} // namespace rmon::events
