/**
 * @file device_probe.cpp
 * @brief Per-call scope derivation and failure classification for DeviceProbe calls.
 */
#include "rmon/core/device_probe.hpp"

#include <utility>

namespace rmon::core {

rmon_detail::expected<std::vector<Record>, ProbeFailure>
run_command(DeviceProbe& probe, const Command& cmd,
            std::stop_token parent, std::chrono::milliseconds timeout) {
    using rmon_detail::unexpected;

    if (parent.stop_requested()) {
        return unexpected(ProbeFailure{ProbeErr::Cancelled, "cancelled before call"});
    }

    // Child scope: stops with the parent, and is bounded by its own deadline.
    std::stop_source child;
    std::stop_callback link(parent, [&child] { child.request_stop(); });
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    ProbeResult r = probe.execute(cmd, CallContext{child.get_token(), deadline});

    if (parent.stop_requested()) {
        return unexpected(ProbeFailure{ProbeErr::Cancelled, "cancelled during call"});
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        return unexpected(ProbeFailure{ProbeErr::TimedOut, describe(cmd) + " exceeded deadline"});
    }
    if (!r.error.empty()) {
        return unexpected(ProbeFailure{ProbeErr::Failed, std::move(r.error)});
    }
    if (!r.success) {
        return unexpected(ProbeFailure{ProbeErr::Rejected, describe(cmd) + " not successful"});
    }
    return std::move(r.records);
}

std::string describe(const Command& cmd) {
    std::string out = cmd.router_id.empty() ? std::string("<default>") : cmd.router_id;
    out += cmd.path;
    out += ' ';
    out += cmd.action;
    return out;
}

const char* to_string(ProbeErr e) noexcept {
    switch (e) {
        case ProbeErr::Failed:    return "failed";
        case ProbeErr::Rejected:  return "rejected";
        case ProbeErr::TimedOut:  return "timed_out";
        case ProbeErr::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace rmon::core
