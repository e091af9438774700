#pragma once
/**
 * @file interface_stats.hpp
 * @brief Interface byte/packet/error/drop counters polled per "routerID:interfaceID".
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rmon/telemetry/point_source.hpp"
#include "rmon/telemetry/polling_multiplexer.hpp"

namespace rmon::telemetry {

/** @struct InterfaceStatsPoint
 *  @brief One poll of one interface: cumulative counters plus per-second rates since the
 *         previous poll of the same session (zero on the first poll).
 */
struct InterfaceStatsPoint {
    std::string                           router_id;
    std::string                           interface_id;
    std::chrono::system_clock::time_point timestamp{};

    uint64_t tx_bytes{0}, rx_bytes{0};
    uint64_t tx_packets{0}, rx_packets{0};
    uint64_t tx_errors{0}, rx_errors{0};
    uint64_t tx_drops{0}, rx_drops{0};

    double tx_bytes_per_sec{0}, rx_bytes_per_sec{0};
    double tx_packets_per_sec{0}, rx_packets_per_sec{0};
    double tx_errors_per_sec{0}, rx_errors_per_sec{0};
};

/** @class InterfaceStatsSource
 *  @brief Issues `/interface print stats` for one interface and derives rates.
 */
class InterfaceStatsSource final : public PointSource<InterfaceStatsPoint> {
public:
    InterfaceStatsSource(std::string router_id, std::string interface_id);

    /// Null when @p key is not "routerID:interfaceID".
    static std::unique_ptr<InterfaceStatsSource> from_key(const std::string& key);

    core::Command command() const override;
    std::optional<InterfaceStatsPoint> build(const std::vector<core::Record>& rows,
                                             std::chrono::system_clock::time_point now) override;
    events::Event to_event(const InterfaceStatsPoint& p) const override;

private:
    std::string                        router_id_;
    std::string                        interface_id_;
    std::optional<InterfaceStatsPoint> previous_;
};

using InterfaceStatsMultiplexer = PollingMultiplexer<InterfaceStatsPoint>;

/// Bounds 1 s - 30 s, default 5 s.
MultiplexerConfig interface_stats_defaults();

/// Multiplexer wired with InterfaceStatsSource::from_key.
rmon_detail::expected<std::unique_ptr<InterfaceStatsMultiplexer>, core::SetupError>
make_interface_stats_multiplexer(MultiplexerConfig cfg,
                                 std::shared_ptr<core::DeviceProbe> probe,
                                 std::shared_ptr<events::AsyncEventPublisher> publisher,
                                 std::shared_ptr<rmon::obs::Observer> observer = nullptr);

/// JSON body of the interface.traffic.update event.
nlohmann::json to_json(const InterfaceStatsPoint& p);

} // namespace rmon::telemetry

extern template class rmon::telemetry::PollingMultiplexer<rmon::telemetry::InterfaceStatsPoint>;
