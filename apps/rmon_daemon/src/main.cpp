/**
 * @file main.cpp
 * @brief rmon_daemon: wires configuration, device, telemetry, health and history.
 *
 * **Bootstrap**
 * - Load JSON config (optional first argument) and configure logging.
 * - Construct the simulated router, event publisher, both multiplexers, the health
 *   monitor and the tiered history store.
 *
 * **Run**
 * - Subscribe to one interface and one service; consumers drain their feeds.
 * - Interface points feed the history store; compaction runs on its own cadence.
 * - Health links come from the config (a demo link otherwise); one target flaps.
 *
 * **Shutdown**
 * - Cancel subscriber scopes, stop multiplexers and health loops, drain events, print counters.
 *
 * Usage: rmon_daemon [config.json] [run_seconds]
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "rmon/config/config_loader.hpp"
#include "rmon/core/cancellation.hpp"
#include "rmon/core/simulated_probe.hpp"
#include "rmon/events/async_publisher.hpp"
#include "rmon/events/log_sink.hpp"
#include "rmon/health/health_monitor.hpp"
#include "rmon/history/tiered_store.hpp"
#include "rmon/obs/log.hpp"
#include "rmon/obs/observability.hpp"
#include "rmon/telemetry/interface_stats.hpp"
#include "rmon/telemetry/traffic_stats.hpp"
#include "rmon/version.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted.store(true); }

std::shared_ptr<rmon::core::SimulatedDeviceProbe> make_device() {
    using rmon::core::SimInterfaceCounters;
    using rmon::core::SimServiceCounters;
    auto dev = std::make_shared<rmon::core::SimulatedDeviceProbe>();
    dev->set_interface("r1", "ether1", SimInterfaceCounters{});
    dev->set_interface_growth("r1", "ether1", SimInterfaceCounters{125000, 500000, 100, 400, 0, 1, 0, 0});
    dev->set_interface("r1", "ether2", SimInterfaceCounters{});
    dev->set_interface_growth("r1", "ether2", SimInterfaceCounters{1000, 2000, 10, 20, 0, 0, 0, 0});
    dev->set_service("svc-a", SimServiceCounters{});
    dev->set_service_growth("svc-a", SimServiceCounters{64000, 256000, 50, 200});
    return dev;
}

template <class Point>
std::jthread drain(std::shared_ptr<rmon::mem::Feed<std::shared_ptr<const Point>>> feed,
                   const char* label) {
    return std::jthread([feed = std::move(feed), label](std::stop_token st) {
        while (auto p = feed->next(st)) {
            rmon::obs::logger()->info("{}: tx={:.0f}B/s rx={:.0f}B/s", label,
                                      (*p)->tx_bytes_per_sec, (*p)->rx_bytes_per_sec);
        }
    });
}

} // namespace

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "";
    const int run_seconds = argc > 2 ? std::atoi(argv[2]) : 15;

    using LoadResult = rmon_detail::expected<rmon::config::MonitorConfig, rmon::config::ConfigError>;
    LoadResult loaded = config_path.empty() ? LoadResult(rmon::config::default_config())
                                            : rmon::config::Loader::load_from_file(config_path);
    if (!loaded) {
        std::cerr << "config error at '" << loaded.error().path << "': " << loaded.error().message << "\n";
        return 2;
    }
    const rmon::config::MonitorConfig& cfg = *loaded;
    if (!rmon::obs::init_logging(cfg.logging)) {
        std::cerr << "unknown log level '" << cfg.logging.level << "'\n";
        return 2;
    }
    auto log = rmon::obs::logger();
    log->info("rmon_daemon {} starting for {}s", rmon::version_string, run_seconds);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto observer = rmon::obs::make_simple_observer();
    auto device   = make_device();
    auto sink     = std::make_shared<rmon::events::LogEventSink>();

    auto publisher = rmon::events::AsyncEventPublisher::create(sink, cfg.events.queue_capacity, observer);
    if (!publisher) {
        log->critical("publisher setup failed: {}", rmon::core::to_string(publisher.error()));
        return 1;
    }
    auto ifaces = rmon::telemetry::make_interface_stats_multiplexer(cfg.interface_stats, device,
                                                                    *publisher, observer);
    auto traffic = rmon::telemetry::make_service_traffic_multiplexer(cfg.traffic_stats, device,
                                                                     *publisher, observer);
    auto health = rmon::health::HealthMonitor::create(device, *publisher, observer, cfg.health.options);
    auto store  = rmon::history::TieredMetricsStore::create(
        rmon::history::make_in_memory_tiers(cfg.history.store), cfg.history.store);
    if (!ifaces || !traffic || !health || !store) {
        log->critical("component setup failed");
        return 1;
    }

    (*ifaces)->set_point_hook([&s = **store](const std::string& key,
                                             const rmon::telemetry::InterfaceStatsPoint& p) {
        s.record(key, rmon::history::to_history_point(p));
    });

    // Health links
    auto links = cfg.health.links;
    if (links.empty()) {
        rmon::health::HealthLinkConfig demo;
        demo.enabled      = true;
        demo.targets      = {"1.1.1.1", "8.8.8.8"};
        demo.interval_sec = 1;
        links.emplace("r1:wan1", demo);
    }
    for (const auto& [key, link] : links) {
        if (auto r = (*health)->configure_health_check(key, link); !r) {
            log->error("health link {} not configured: {}", key, rmon::health::to_string(r.error()));
        }
    }

    // Subscribers
    std::stop_source subscribers;
    std::vector<std::jthread> consumers;
    if (auto f = (*ifaces)->subscribe("r1:ether1", std::chrono::seconds{1}, subscribers.get_token())) {
        consumers.push_back(drain<rmon::telemetry::InterfaceStatsPoint>(*f, "r1:ether1"));
    } else {
        log->error("subscribe r1:ether1 failed: {}", rmon::telemetry::to_string(f.error()));
    }
    if (auto f = (*traffic)->subscribe("svc-a", std::chrono::milliseconds{0}, subscribers.get_token())) {
        consumers.push_back(drain<rmon::telemetry::ServiceTrafficPoint>(*f, "svc-a"));
    } else {
        log->error("subscribe svc-a failed: {}", rmon::telemetry::to_string(f.error()));
    }

    std::jthread compactor([&s = **store, every = cfg.history.compact_interval](std::stop_token st) {
        while (rmon::core::sleep_for(st, every)) s.compact();
    });

    // Main loop: one target flaps every few seconds.
    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds{run_seconds};
    bool up = true;
    int tick = 0;
    while (!g_interrupted.load() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds{250});
        if (++tick % 16 == 0) {
            up = !up;
            device->set_host_reachable("8.8.8.8", up);
        }
    }

    log->info("shutting down");
    subscribers.request_stop();
    consumers.clear();
    compactor.request_stop();
    (*ifaces)->stop();
    (*traffic)->stop();
    (*health)->shutdown();
    (*publisher)->stop();

    const auto c = observer->snapshot();
    std::cout << "polls=" << c.polls << " probe_failures=" << c.probe_failures
              << " points=" << c.points_broadcast << " dropped_updates=" << c.updates_dropped
              << " events=" << c.events_enqueued << " dropped_events=" << c.events_dropped
              << " publish_failures=" << c.publish_failures
              << " health_transitions=" << c.health_transitions << "\n";
    return 0;
}
