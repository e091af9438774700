#pragma once
/**
 * @file rate.hpp
 * @brief Counter-to-rate conversion shared by the stats sources.
 */

#include <cstdint>

namespace rmon::telemetry {

/**
 * @brief Per-second rate between two cumulative counter readings.
 * @return (current - previous) / interval_seconds; 0 when the counter went backwards
 *         (device reboot / counter reset) or the interval is not positive. Never negative.
 */
double calculate_rate(uint64_t current, uint64_t previous, double interval_seconds) noexcept;

} // namespace rmon::telemetry
