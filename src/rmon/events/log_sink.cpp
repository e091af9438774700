/**
 * @file log_sink.cpp
 * @brief LogEventSink implementation.
 */
#include "rmon/events/log_sink.hpp"
#include "rmon/obs/log.hpp"

namespace rmon::events {

rmon_detail::expected<void, PublishError> LogEventSink::publish(const Event& e) {
    // Background traffic updates are frequent; keep them below info.
    const auto lvl = e.priority == Priority::Background ? spdlog::level::debug : spdlog::level::info;
    rmon::obs::logger()->log(lvl, "event {}", to_json(e).dump());
    published_.fetch_add(1, std::memory_order_relaxed);
    return {};
}

} // namespace rmon::events
