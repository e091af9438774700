#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the telemetry, health and history components.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace rmon::config::constants {

// =====================
// Subscriber delivery
// =====================
/// Per-subscriber queue depth; excess updates are dropped for that subscriber only.
inline constexpr std::size_t SUBSCRIBER_QUEUE_CAPACITY = 10;

/// Upper bound on any single device command issued by a poll loop.
inline constexpr uint32_t PROBE_FETCH_TIMEOUT_MS = 5000;

// =====================
// Interface counters (key "routerID:interfaceID")
// =====================
inline constexpr uint32_t IFACE_STATS_MIN_INTERVAL_MS     = 1000;   ///< 1 s
inline constexpr uint32_t IFACE_STATS_MAX_INTERVAL_MS     = 30000;  ///< 30 s
inline constexpr uint32_t IFACE_STATS_DEFAULT_INTERVAL_MS = 5000;   ///< 5 s

// =====================
// Per-service traffic counters (key "instanceID")
// =====================
inline constexpr uint32_t TRAFFIC_STATS_MIN_INTERVAL_MS     = 5000;   ///< 5 s
inline constexpr uint32_t TRAFFIC_STATS_MAX_INTERVAL_MS     = 60000;  ///< 60 s
inline constexpr uint32_t TRAFFIC_STATS_DEFAULT_INTERVAL_MS = 10000;  ///< 10 s

/// Comment prefix of the mangle rules counting one service instance's traffic.
inline constexpr const char* SERVICE_MANGLE_TAG_PREFIX = "rmon-svc:";

// =====================
// WAN health defaults
// =====================
inline constexpr uint32_t HEALTH_DEFAULT_INTERVAL_SEC      = 10; ///< Probe + poll cadence
inline constexpr uint32_t HEALTH_DEFAULT_TIMEOUT_SEC       = 2;  ///< Per-target device-side timeout
inline constexpr uint32_t HEALTH_DEFAULT_FAILURE_THRESHOLD = 3;  ///< Device-side up/down latch
inline constexpr uint32_t HEALTH_COMMAND_TIMEOUT_MS        = 5000;

/// Comment prefix used to tag device-side probes owned by a monitored link.
inline constexpr const char* HEALTH_PROBE_TAG_PREFIX = "rmon-health:";

// =====================
// History tiers
// Units: seconds
// =====================
inline constexpr uint32_t HISTORY_HOT_WINDOW_SEC       = 3600;        ///< age <= 1 h: full resolution
inline constexpr uint32_t HISTORY_WARM_WINDOW_SEC      = 86400;       ///< age <= 24 h: warm tier
inline constexpr uint32_t HISTORY_WARM_RESOLUTION_SEC  = 300;         ///< 5-minute buckets
inline constexpr uint32_t HISTORY_COLD_RESOLUTION_SEC  = 3600;        ///< 1-hour buckets
inline constexpr uint32_t HISTORY_COLD_RETENTION_SEC   = 30 * 86400;  ///< 30 days
inline constexpr std::size_t HISTORY_MAX_POINTS        = 1000;        ///< Bound on returned series
inline constexpr uint32_t HISTORY_COMPACT_INTERVAL_SEC = 60;          ///< Daemon compaction cadence

// =====================
// Outbound events
// =====================
inline constexpr std::size_t EVENT_QUEUE_CAPACITY = 1024;

// =====================
// Logging
// =====================
inline constexpr const char* LOG_DEFAULT_LEVEL   = "info";
inline constexpr const char* LOG_DEFAULT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
inline constexpr const char* LOGGER_NAME         = "rmon";

} // namespace rmon::config::constants
