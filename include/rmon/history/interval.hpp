#pragma once
/**
 * @file interval.hpp
 * @brief Duration strings used by history queries ("30s", "5m", "1h30m", "1d", "2w").
 */

#include <chrono>
#include <string_view>

#include "rmon/compat/expected.hpp"
#include "rmon/history/metrics_tier.hpp"

namespace rmon::history {

/**
 * @brief Parse a sequence of <number><unit> terms.
 * @details Units: ns, us (or µs), ms, s, m, h, d, w. Numbers may carry a fraction.
 * @return InvalidInterval for empty input, a missing or unknown unit, or a total <= 0.
 */
rmon_detail::expected<std::chrono::nanoseconds, HistoryError> parse_interval(std::string_view text);

} // namespace rmon::history
