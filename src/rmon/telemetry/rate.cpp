#include "rmon/telemetry/rate.hpp"

namespace rmon::telemetry {

double calculate_rate(uint64_t current, uint64_t previous, double interval_seconds) noexcept {
    if (!(interval_seconds > 0.0)) return 0.0; // also rejects NaN
    if (current < previous) return 0.0;        // counter reset
    return static_cast<double>(current - previous) / interval_seconds;
}

} // namespace rmon::telemetry
