/**
 * @file traffic_stats.cpp
 * @brief Service traffic source and the ServiceTrafficMultiplexer instantiation.
 */
#include "rmon/telemetry/traffic_stats.hpp"
#include "rmon/core/resource_key.hpp"
#include "rmon/telemetry/counter_parse.hpp"
#include "rmon/telemetry/rate.hpp"

#include <utility>

template class rmon::telemetry::PollingMultiplexer<rmon::telemetry::ServiceTrafficPoint>;

namespace rmon::telemetry {

ServiceTrafficSource::ServiceTrafficSource(std::string router_id, std::string instance_id)
    : router_id_(std::move(router_id)), instance_id_(std::move(instance_id)) {}

std::unique_ptr<ServiceTrafficSource> ServiceTrafficSource::from_key(const std::string& key) {
    if (key.empty()) return nullptr;
    if (key.find(':') == std::string::npos) {
        return std::make_unique<ServiceTrafficSource>(std::string{}, key);
    }
    auto k = core::split_resource_key(key);
    if (!k) return nullptr;
    return std::make_unique<ServiceTrafficSource>(std::move(k->router_id), std::move(k->child_id));
}

core::Command ServiceTrafficSource::command() const {
    core::Command cmd;
    cmd.router_id = router_id_;
    cmd.path      = "/ip/firewall/mangle";
    cmd.action    = "print";
    cmd.args      = {{"stats", ""}};
    cmd.filter    = {{"comment", std::string(rmon::config::constants::SERVICE_MANGLE_TAG_PREFIX) + instance_id_}};
    return cmd;
}

std::optional<ServiceTrafficPoint>
ServiceTrafficSource::build(const std::vector<core::Record>& rows,
                            std::chrono::system_clock::time_point now) {
    ServiceTrafficPoint p;
    p.instance_id = instance_id_;
    p.router_id   = router_id_;
    p.timestamp   = now;

    bool counted = false;
    for (const auto& row : rows) {
        auto chain = row.find("chain");
        if (chain == row.end()) continue;
        auto bytes   = counter_field(row, "bytes");
        auto packets = counter_field(row, "packets");
        if (!bytes || !packets) return std::nullopt;
        if (chain->second == "postrouting") {
            p.tx_bytes += *bytes;
            p.tx_packets += *packets;
            counted = true;
        } else if (chain->second == "prerouting") {
            p.rx_bytes += *bytes;
            p.rx_packets += *packets;
            counted = true;
        }
    }
    if (!counted) return std::nullopt;

    if (previous_) {
        const double secs = std::chrono::duration<double>(now - previous_->timestamp).count();
        p.tx_bytes_per_sec   = calculate_rate(p.tx_bytes, previous_->tx_bytes, secs);
        p.rx_bytes_per_sec   = calculate_rate(p.rx_bytes, previous_->rx_bytes, secs);
        p.tx_packets_per_sec = calculate_rate(p.tx_packets, previous_->tx_packets, secs);
        p.rx_packets_per_sec = calculate_rate(p.rx_packets, previous_->rx_packets, secs);
    }
    previous_ = p;
    return p;
}

events::Event ServiceTrafficSource::to_event(const ServiceTrafficPoint& p) const {
    events::Event e;
    e.type         = events::kServiceTrafficUpdate;
    e.priority     = events::Priority::Background;
    e.source       = "service-traffic";
    e.timestamp    = p.timestamp;
    e.resource_key = p.router_id.empty() ? p.instance_id
                                         : core::join_resource_key(p.router_id, p.instance_id);
    e.payload      = to_json(p);
    return e;
}

nlohmann::json to_json(const ServiceTrafficPoint& p) {
    return nlohmann::json{
        {"instance_id", p.instance_id},
        {"router_id", p.router_id},
        {"timestamp_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                             p.timestamp.time_since_epoch()).count()},
        {"tx_bytes", p.tx_bytes},
        {"rx_bytes", p.rx_bytes},
        {"tx_packets", p.tx_packets},
        {"rx_packets", p.rx_packets},
        {"tx_bytes_per_sec", p.tx_bytes_per_sec},
        {"rx_bytes_per_sec", p.rx_bytes_per_sec},
        {"tx_packets_per_sec", p.tx_packets_per_sec},
        {"rx_packets_per_sec", p.rx_packets_per_sec},
    };
}

MultiplexerConfig traffic_stats_defaults() {
    using namespace rmon::config::constants;
    MultiplexerConfig c;
    c.name             = "service-traffic";
    c.min_interval     = std::chrono::milliseconds{TRAFFIC_STATS_MIN_INTERVAL_MS};
    c.max_interval     = std::chrono::milliseconds{TRAFFIC_STATS_MAX_INTERVAL_MS};
    c.default_interval = std::chrono::milliseconds{TRAFFIC_STATS_DEFAULT_INTERVAL_MS};
    return c;
}

rmon_detail::expected<std::unique_ptr<ServiceTrafficMultiplexer>, core::SetupError>
make_service_traffic_multiplexer(MultiplexerConfig cfg,
                                 std::shared_ptr<core::DeviceProbe> probe,
                                 std::shared_ptr<events::AsyncEventPublisher> publisher,
                                 std::shared_ptr<rmon::obs::Observer> observer) {
    SourceFactory<ServiceTrafficPoint> factory =
        [](const std::string& key) -> std::unique_ptr<PointSource<ServiceTrafficPoint>> {
        return ServiceTrafficSource::from_key(key);
    };
    return ServiceTrafficMultiplexer::create(std::move(cfg), std::move(probe),
                                             std::move(publisher), std::move(factory),
                                             std::move(observer));
}

} // namespace rmon::telemetry
