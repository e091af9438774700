/**
 * @file interface_stats.cpp
 * @brief Interface counter source and the InterfaceStatsMultiplexer instantiation.
 */
#include "rmon/telemetry/interface_stats.hpp"
#include "rmon/core/resource_key.hpp"
#include "rmon/telemetry/counter_parse.hpp"
#include "rmon/telemetry/rate.hpp"

#include <utility>

template class rmon::telemetry::PollingMultiplexer<rmon::telemetry::InterfaceStatsPoint>;

namespace rmon::telemetry {

namespace {

const core::Record* find_row(const std::vector<core::Record>& rows, const std::string& iface) {
    for (const auto& row : rows) {
        for (const char* field : {".id", "name"}) {
            auto it = row.find(field);
            if (it != row.end() && it->second == iface) return &row;
        }
    }
    // A filtered print may omit .id; accept a lone row only if it names no interface.
    if (rows.size() != 1) return nullptr;
    const auto& row = rows.front();
    return (row.count(".id") == 0 && row.count("name") == 0) ? &row : nullptr;
}

} // namespace

InterfaceStatsSource::InterfaceStatsSource(std::string router_id, std::string interface_id)
    : router_id_(std::move(router_id)), interface_id_(std::move(interface_id)) {}

std::unique_ptr<InterfaceStatsSource> InterfaceStatsSource::from_key(const std::string& key) {
    auto k = core::split_resource_key(key);
    if (!k) return nullptr;
    return std::make_unique<InterfaceStatsSource>(std::move(k->router_id), std::move(k->child_id));
}

core::Command InterfaceStatsSource::command() const {
    core::Command cmd;
    cmd.router_id = router_id_;
    cmd.path      = "/interface";
    cmd.action    = "print";
    cmd.args      = {{"stats", ""}};
    cmd.filter    = {{".id", interface_id_}};
    return cmd;
}

std::optional<InterfaceStatsPoint>
InterfaceStatsSource::build(const std::vector<core::Record>& rows,
                            std::chrono::system_clock::time_point now) {
    const core::Record* row = find_row(rows, interface_id_);
    if (!row) return std::nullopt;

    auto tx_b = counter_field(*row, "tx-byte");
    auto rx_b = counter_field(*row, "rx-byte");
    auto tx_p = counter_field(*row, "tx-packet");
    auto rx_p = counter_field(*row, "rx-packet");
    if (!tx_b || !rx_b || !tx_p || !rx_p) return std::nullopt;

    InterfaceStatsPoint p;
    p.router_id    = router_id_;
    p.interface_id = interface_id_;
    p.timestamp    = now;
    p.tx_bytes     = *tx_b;
    p.rx_bytes     = *rx_b;
    p.tx_packets   = *tx_p;
    p.rx_packets   = *rx_p;
    // Error and drop counters are absent on some interface types.
    p.tx_errors    = counter_field(*row, "tx-error").value_or(0);
    p.rx_errors    = counter_field(*row, "rx-error").value_or(0);
    p.tx_drops     = counter_field(*row, "tx-drop").value_or(0);
    p.rx_drops     = counter_field(*row, "rx-drop").value_or(0);

    if (previous_) {
        const double secs = std::chrono::duration<double>(now - previous_->timestamp).count();
        p.tx_bytes_per_sec   = calculate_rate(p.tx_bytes, previous_->tx_bytes, secs);
        p.rx_bytes_per_sec   = calculate_rate(p.rx_bytes, previous_->rx_bytes, secs);
        p.tx_packets_per_sec = calculate_rate(p.tx_packets, previous_->tx_packets, secs);
        p.rx_packets_per_sec = calculate_rate(p.rx_packets, previous_->rx_packets, secs);
        p.tx_errors_per_sec  = calculate_rate(p.tx_errors, previous_->tx_errors, secs);
        p.rx_errors_per_sec  = calculate_rate(p.rx_errors, previous_->rx_errors, secs);
    }
    previous_ = p;
    return p;
}

events::Event InterfaceStatsSource::to_event(const InterfaceStatsPoint& p) const {
    events::Event e;
    e.type         = events::kInterfaceTrafficUpdate;
    e.priority     = events::Priority::Background;
    e.source       = "interface-stats";
    e.timestamp    = p.timestamp;
    e.resource_key = core::join_resource_key(p.router_id, p.interface_id);
    e.payload      = to_json(p);
    return e;
}

nlohmann::json to_json(const InterfaceStatsPoint& p) {
    return nlohmann::json{
        {"router_id", p.router_id},
        {"interface_id", p.interface_id},
        {"timestamp_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                             p.timestamp.time_since_epoch()).count()},
        {"tx_bytes", p.tx_bytes},
        {"rx_bytes", p.rx_bytes},
        {"tx_packets", p.tx_packets},
        {"rx_packets", p.rx_packets},
        {"tx_errors", p.tx_errors},
        {"rx_errors", p.rx_errors},
        {"tx_drops", p.tx_drops},
        {"rx_drops", p.rx_drops},
        {"tx_bytes_per_sec", p.tx_bytes_per_sec},
        {"rx_bytes_per_sec", p.rx_bytes_per_sec},
        {"tx_packets_per_sec", p.tx_packets_per_sec},
        {"rx_packets_per_sec", p.rx_packets_per_sec},
        {"tx_errors_per_sec", p.tx_errors_per_sec},
        {"rx_errors_per_sec", p.rx_errors_per_sec},
    };
}

MultiplexerConfig interface_stats_defaults() {
    using namespace rmon::config::constants;
    MultiplexerConfig c;
    c.name             = "interface-stats";
    c.min_interval     = std::chrono::milliseconds{IFACE_STATS_MIN_INTERVAL_MS};
    c.max_interval     = std::chrono::milliseconds{IFACE_STATS_MAX_INTERVAL_MS};
    c.default_interval = std::chrono::milliseconds{IFACE_STATS_DEFAULT_INTERVAL_MS};
    return c;
}

rmon_detail::expected<std::unique_ptr<InterfaceStatsMultiplexer>, core::SetupError>
make_interface_stats_multiplexer(MultiplexerConfig cfg,
                                 std::shared_ptr<core::DeviceProbe> probe,
                                 std::shared_ptr<events::AsyncEventPublisher> publisher,
                                 std::shared_ptr<rmon::obs::Observer> observer) {
    SourceFactory<InterfaceStatsPoint> factory =
        [](const std::string& key) -> std::unique_ptr<PointSource<InterfaceStatsPoint>> {
        return InterfaceStatsSource::from_key(key);
    };
    return InterfaceStatsMultiplexer::create(std::move(cfg), std::move(probe),
                                             std::move(publisher), std::move(factory),
                                             std::move(observer));
}

} // namespace rmon::telemetry
