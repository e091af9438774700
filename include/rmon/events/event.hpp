#pragma once
/**
 * @file event.hpp
 * @brief Domain event model and the outbound EventSink capability.
 */

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "rmon/compat/expected.hpp"

namespace rmon::events {

/** @enum Priority
 *  @brief Delivery urgency hint for downstream transports.
 */
enum class Priority : uint8_t {
    Immediate = 0,
    Critical,
    Normal,
    Low,
    Background
};

/// Event type labels emitted by the core.
inline constexpr const char* kInterfaceTrafficUpdate = "interface.traffic.update";
inline constexpr const char* kServiceTrafficUpdate   = "service.traffic.update";
inline constexpr const char* kWanHealthChanged       = "wan.health.changed";

/** @struct Event
 *  @brief One outbound event; payload is the JSON body handed to the transport.
 */
struct Event {
    std::string                           type;
    Priority                              priority{Priority::Normal};
    std::string                           source;       ///< Emitting component, e.g. "wan-health-monitor"
    std::chrono::system_clock::time_point timestamp{};
    std::string                           resource_key; ///< Session or link key
    nlohmann::json                        payload;
};

/** @struct PublishError
 *  @brief Sink-side failure description.
 */
struct PublishError {
    std::string message;
};

/** @class EventSink
 *  @brief Best-effort outbound event capability (bus, webhook fan-out, ...).
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual rmon_detail::expected<void, PublishError> publish(const Event& e) = 0;
};

const char* to_string(Priority p) noexcept;

/// Serialize envelope + payload (used by log-backed sinks).
nlohmann::json to_json(const Event& e);

} // namespace rmon::events
