#pragma once
/**
 * @file traffic_stats.hpp
 * @brief Per-service-instance traffic counters read from tagged mangle rules.
 * @details Key is "instanceID" (adapter default router) or "routerID:instanceID".
 *          Prerouting rules count inbound (rx), postrouting rules outbound (tx).
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

struct ServiceTrafficPoint {
    std::string                           instance_id;
    std::string                           router_id; ///< Empty for the default router
    std::chrono::system_clock::time_point timestamp{};

    uint64_t tx_bytes{0}, rx_bytes{0};
    uint64_t tx_packets{0}, rx_packets{0};

    double tx_bytes_per_sec{0}, rx_bytes_per_sec{0};
    double tx_packets_per_sec{0}, rx_packets_per_sec{0};
};

class ServiceTrafficSource final : public PointSource<ServiceTrafficPoint> {
public:
    ServiceTrafficSource(std::string router_id, std::string instance_id);

    /// Null for an empty key or an empty half of "router:instance".
    static std::unique_ptr<ServiceTrafficSource> from_key(const std::string& key);

    core::Command command() const override;
    std::optional<ServiceTrafficPoint> build(const std::vector<core::Record>& rows,
                                             std::chrono::system_clock::time_point now) override;
    events::Event to_event(const ServiceTrafficPoint& p) const override;

private:
    std::string                        router_id_;
    std::string                        instance_id_;
    std::optional<ServiceTrafficPoint> previous_;
};

using ServiceTrafficMultiplexer = PollingMultiplexer<ServiceTrafficPoint>;

/// Bounds 5 s - 60 s, default 10 s.
MultiplexerConfig traffic_stats_defaults();

rmon_detail::expected<std::unique_ptr<ServiceTrafficMultiplexer>, core::SetupError>
make_service_traffic_multiplexer(MultiplexerConfig cfg,
                                 std::shared_ptr<core::DeviceProbe> probe,
                                 std::shared_ptr<events::AsyncEventPublisher> publisher,
                                 std::shared_ptr<rmon::obs::Observer> observer = nullptr);

nlohmann::json to_json(const ServiceTrafficPoint& p);

} // namespace rmon::telemetry

extern template class rmon::telemetry::PollingMultiplexer<rmon::telemetry::ServiceTrafficPoint>;
