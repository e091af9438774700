#pragma once
/**
 * @file simulated_probe.hpp
 * @brief In-process device model implementing DeviceProbe.
 * @details Serves interface counters, service mangle counters and a netwatch table so the
 *          apps and tests run without a device. Failure, empty-result and latency modes
 *          can be injected at runtime.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "rmon/core/device_probe.hpp"

namespace rmon::core {

/** @struct SimInterfaceCounters
 *  @brief Cumulative counters of one simulated interface.
 */
struct SimInterfaceCounters {
    uint64_t tx_bytes{0}, rx_bytes{0};
    uint64_t tx_packets{0}, rx_packets{0};
    uint64_t tx_errors{0}, rx_errors{0};
    uint64_t tx_drops{0}, rx_drops{0};
};

/** @struct SimServiceCounters
 *  @brief Cumulative mangle counters of one service instance (tx = postrouting, rx = prerouting).
 */
struct SimServiceCounters {
    uint64_t tx_bytes{0}, rx_bytes{0};
    uint64_t tx_packets{0}, rx_packets{0};
};

/// Injected behavior applied to every call.
enum class SimMode : uint8_t { Normal, Error, Rejected, Empty };

/** @class SimulatedDeviceProbe
 *  @brief Thread-safe simulated router.
 */
class SimulatedDeviceProbe final : public DeviceProbe {
public:
    ProbeResult execute(const Command& cmd, const CallContext& ctx) override;

    /// Create or overwrite an interface.
    void set_interface(const std::string& router_id, const std::string& iface_id,
                       const SimInterfaceCounters& c);
    /// Counters added to an interface after every read (simulates traffic).
    void set_interface_growth(const std::string& router_id, const std::string& iface_id,
                              const SimInterfaceCounters& step);

    void set_service(const std::string& instance_id, const SimServiceCounters& c);
    void set_service_growth(const std::string& instance_id, const SimServiceCounters& step);

    /// Reachability reported for netwatch entries watching @p host (default: up).
    void set_host_reachable(const std::string& host, bool up);

    void set_mode(SimMode m) noexcept { mode_.store(m, std::memory_order_relaxed); }
    void set_latency(std::chrono::milliseconds d) noexcept { latency_ms_.store(d.count(), std::memory_order_relaxed); }

    /// Number of calls seen for a path/action pair.
    std::size_t calls(std::string_view path, std::string_view action) const;
    /// Total calls of any kind.
    std::size_t total_calls() const noexcept { return total_calls_.load(std::memory_order_relaxed); }

    /// Current netwatch rows of a router (status evaluated now).
    std::vector<Record> netwatch(const std::string& router_id) const;

private:
    struct Iface {
        SimInterfaceCounters now{};
        SimInterfaceCounters step{};
    };
    struct Service {
        SimServiceCounters now{};
        SimServiceCounters step{};
    };
    struct Watch {
        std::string id;
        Record      args;
    };

    ProbeResult interfaces(const Command& cmd);
    ProbeResult mangle(const Command& cmd);
    ProbeResult netwatch_cmd(const Command& cmd);

    std::string status_of(const std::string& host) const;
    static bool matches(const Record& row, const std::map<std::string, std::string>& filter);

    mutable std::mutex mu_;
    std::map<std::string, std::map<std::string, Iface>> ifaces_;    ///< router -> iface
    std::map<std::string, Service>                      services_;  ///< instance -> counters
    std::map<std::string, std::vector<Watch>>           watches_;   ///< router -> netwatch rows
    std::map<std::string, bool>                         reachable_; ///< host -> up
    std::map<std::string, std::size_t>                  calls_;     ///< "path action" -> count
    uint64_t                                            next_id_{1};

    std::atomic<SimMode>      mode_{SimMode::Normal};
    std::atomic<int64_t>      latency_ms_{0};
    std::atomic<std::size_t>  total_calls_{0};
};

} // namespace rmon::core
