/**
 * @file interval.cpp
 * @brief parse_interval implementation.
 */
#include "rmon/history/interval.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace rmon::history {

namespace {

constexpr double kNs = 1.0;

bool numeric(char c) noexcept { return (c >= '0' && c <= '9') || c == '.'; }

/// Nanoseconds per unit; 0 when unknown.
double unit_scale(std::string_view u) noexcept {
    static constexpr std::pair<std::string_view, double> kUnits[] = {
        {"ns", kNs},
        {"us", 1e3 * kNs},
        {"\xC2\xB5s", 1e3 * kNs}, // µs
        {"ms", 1e6 * kNs},
        {"s", 1e9 * kNs},
        {"m", 60e9 * kNs},
        {"h", 3600e9 * kNs},
        {"d", 86400e9 * kNs},
        {"w", 604800e9 * kNs},
    };
    for (const auto& [name, scale] : kUnits) {
        if (name == u) return scale;
    }
    return 0.0;
}

} // namespace

rmon_detail::expected<std::chrono::nanoseconds, HistoryError> parse_interval(std::string_view text) {
    const auto bad = rmon_detail::unexpected(HistoryError::InvalidInterval);
    if (text.empty()) return bad;

    double total = 0.0;
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t j = i;
        while (j < text.size() && numeric(text[j])) ++j;
        if (j == i) return bad;

        double value = 0.0;
        const char* first = text.data() + i;
        const char* last  = text.data() + j;
        auto [p, ec] = std::from_chars(first, last, value, std::chars_format::fixed);
        if (ec != std::errc{} || p != last) return bad;

        std::size_t k = j;
        while (k < text.size() && !numeric(text[k])) ++k;
        const double scale = unit_scale(text.substr(j, k - j));
        if (scale == 0.0) return bad;

        total += value * scale;
        i = k;
    }

    if (!(total >= 1.0) || total > static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return bad;
    }
    return std::chrono::nanoseconds{static_cast<int64_t>(std::llround(total))};
}

} // namespace rmon::history
