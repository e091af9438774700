/**
 * @file event.cpp
 * @brief Event envelope helpers.
 */
#include "rmon/events/event.hpp"

namespace rmon::events {

const char* to_string(Priority p) noexcept {
    switch (p) {
        case Priority::Immediate:  return "immediate";
        case Priority::Critical:   return "critical";
        case Priority::Normal:     return "normal";
        case Priority::Low:        return "low";
        case Priority::Background: return "background";
    }
    return "unknown";
}

nlohmann::json to_json(const Event& e) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        e.timestamp.time_since_epoch()).count();
    return nlohmann::json{
        {"type", e.type},
        {"priority", to_string(e.priority)},
        {"source", e.source},
        {"timestamp_ms", ms},
        {"resource_key", e.resource_key},
        {"payload", e.payload},
    };
}

} // namespace rmon::events
