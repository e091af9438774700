#pragma once
/**
 * @file log_sink.hpp
 * @brief EventSink writing each event as one JSON line to the rmon logger.
 */

#include <atomic>
#include <cstdint>

#include "rmon/events/event.hpp"

namespace rmon::events {

class LogEventSink final : public EventSink {
public:
    rmon_detail::expected<void, PublishError> publish(const Event& e) override;

    uint64_t published() const noexcept { return published_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> published_{0};
};

} // namespace rmon::events
