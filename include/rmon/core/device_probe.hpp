#pragma once
/**
 * @file device_probe.hpp
 * @brief Pluggable device-command capability: structured command in, key/value records out.
 * @details The core never encodes a device protocol; adapters (API, SSH, simulator)
 *          implement DeviceProbe. Calls may be slow, may fail, and are not assumed to
 *          take effect exactly once.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

#include "rmon/compat/expected.hpp"

namespace rmon::core {

/// One result row (e.g. one interface, one netwatch entry).
using Record = std::map<std::string, std::string>;

/** @struct Command
 *  @brief Device command addressed by menu path and action.
 */
struct Command {
    std::string router_id;                    ///< Target device; empty selects the adapter default
    std::string path;                         ///< Menu path, e.g. "/tool/netwatch"
    std::string action;                       ///< "print", "add", "remove", ...
    std::map<std::string, std::string> args;  ///< Action arguments ("stats", "host", ".id", ...)
    std::map<std::string, std::string> filter;///< Equality filter applied to printed rows

    bool operator==(const Command&) const = default;
};

/** @struct ProbeResult
 *  @brief Raw adapter outcome: records, success flag and error text.
 */
struct ProbeResult {
    std::vector<Record> records;
    bool                success{false};
    std::string         error; ///< Non-empty on transport/device error
};

/** @struct CallContext
 *  @brief Cancellation scope and deadline for one call; adapters should honor both.
 */
struct CallContext {
    std::stop_token                       cancel;
    std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
};

/** @class DeviceProbe
 *  @brief Device-command capability interface.
 */
class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;

    /**
     * @brief Execute a command against the device.
     * @param cmd Structured command.
     * @param ctx Cancellation scope and deadline for this call.
     * @note Implementations must return by ctx.deadline and on ctx.cancel. run_command()
     *       classifies a late return as TimedOut only after the fact and cannot interrupt it.
     */
    virtual ProbeResult execute(const Command& cmd, const CallContext& ctx) = 0;
};

/// Classification of a failed call.
enum class ProbeErr : uint8_t {
    Failed,    ///< Adapter reported an error
    Rejected,  ///< Adapter returned success=false without an error
    TimedOut,  ///< Result arrived after the per-call deadline
    Cancelled  ///< Caller's cancellation scope ended
};

struct ProbeFailure {
    ProbeErr    code{ProbeErr::Failed};
    std::string message;
};

/**
 * @brief Run one command under a child scope of @p parent bounded by @p timeout.
 * @return Records on success (possibly empty), classified failure otherwise.
 */
rmon_detail::expected<std::vector<Record>, ProbeFailure>
run_command(DeviceProbe& probe, const Command& cmd,
            std::stop_token parent, std::chrono::milliseconds timeout);

/// "router/path action" label for log lines.
std::string describe(const Command& cmd);

const char* to_string(ProbeErr e) noexcept;

} // namespace rmon::core
