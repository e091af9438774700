#pragma once
/**
 * @file counter_parse.hpp
 * @brief Strict parsing of decimal counter fields in device records.
 */

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "rmon/core/device_probe.hpp"

namespace rmon::telemetry {

/// Whole-string unsigned decimal; std::nullopt on empty, sign, junk or overflow.
inline std::optional<uint64_t> parse_counter(std::string_view s) noexcept {
    uint64_t v = 0;
    if (s.empty()) return std::nullopt;
    const auto* end = s.data() + s.size();
    auto [p, ec] = std::from_chars(s.data(), end, v);
    if (ec != std::errc{} || p != end) return std::nullopt;
    return v;
}

/// Parse field @p name of @p row.
inline std::optional<uint64_t> counter_field(const core::Record& row, const std::string& name) {
    auto it = row.find(name);
    if (it == row.end()) return std::nullopt;
    return parse_counter(it->second);
}

} // namespace rmon::telemetry
