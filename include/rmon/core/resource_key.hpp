#pragma once
/**
 * @file resource_key.hpp
 * @brief "routerID:childID" keys used by sessions and monitored links.
 */

#include <optional>
#include <string>
#include <string_view>

namespace rmon::core {

struct ResourceKey {
    std::string router_id;
    std::string child_id; ///< Interface, WAN link or service instance
};

/// Split at the first ':'; both halves must be non-empty.
inline std::optional<ResourceKey> split_resource_key(std::string_view key) {
    const auto pos = key.find(':');
    if (pos == std::string_view::npos || pos == 0 || pos + 1 >= key.size()) return std::nullopt;
    return ResourceKey{std::string(key.substr(0, pos)), std::string(key.substr(pos + 1))};
}

inline std::string join_resource_key(std::string_view router_id, std::string_view child_id) {
    std::string out(router_id);
    out += ':';
    out += child_id;
    return out;
}

} // namespace rmon::core
