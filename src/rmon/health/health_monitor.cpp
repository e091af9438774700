/**
 * @file health_monitor.cpp
 * @brief Implementation of HealthMonitor and the aggregation helpers.
 */
#include "rmon/health/health_monitor.hpp"
#include "rmon/core/cancellation.hpp"
#include "rmon/obs/log.hpp"

#include <algorithm>
#include <utility>

namespace rmon::health {

using rmon::obs::Signal;

namespace {

constexpr const char* kNetwatch = "/tool/netwatch";

HealthError from_probe(const core::ProbeFailure& f) noexcept {
    return f.code == core::ProbeErr::Cancelled ? HealthError::Cancelled
                                               : HealthError::DeviceCommandFailed;
}

core::Command list_command(const core::ResourceKey& id, const std::string& tag) {
    return core::Command{id.router_id, kNetwatch, "print", {}, {{"comment", tag}}};
}

} // namespace

HealthVerdict aggregate_health(uint32_t reachable, uint32_t total) noexcept {
    if (total == 0)          return HealthVerdict::Unknown;
    if (reachable >= total)  return HealthVerdict::Healthy;
    if (reachable == 0)      return HealthVerdict::Down;
    return HealthVerdict::Degraded;
}

const char* to_string(HealthVerdict v) noexcept {
    switch (v) {
        case HealthVerdict::Unknown:  return "UNKNOWN";
        case HealthVerdict::Healthy:  return "HEALTHY";
        case HealthVerdict::Degraded: return "DEGRADED";
        case HealthVerdict::Down:     return "DOWN";
    }
    return "UNKNOWN";
}

const char* to_string(HealthError e) noexcept {
    switch (e) {
        case HealthError::InvalidKey:          return "invalid_key";
        case HealthError::MissingTargets:      return "missing_targets";
        case HealthError::InvalidConfig:       return "invalid_config";
        case HealthError::DeviceCommandFailed: return "device_command_failed";
        case HealthError::Cancelled:           return "cancelled";
        case HealthError::Stopped:             return "stopped";
    }
    return "unknown";
}

std::string probe_tag(const std::string& link_key) {
    return std::string(rmon::config::constants::HEALTH_PROBE_TAG_PREFIX) + link_key;
}

nlohmann::json transition_payload(const std::string& link_key, const core::ResourceKey& id,
                                  HealthVerdict previous, const LinkStatus& current) {
    nlohmann::json j{
        {"link_key", link_key},
        {"router_id", id.router_id},
        {"wan_interface_id", id.child_id},
        {"previous_status", to_string(previous)},
        {"status", to_string(current.verdict)},
        {"reachable", current.reachable},
        {"total", current.total},
    };
    if (current.last_check) {
        j["checked_at_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 current.last_check->time_since_epoch()).count();
    }
    return j;
}

rmon_detail::expected<std::unique_ptr<HealthMonitor>, core::SetupError>
HealthMonitor::create(std::shared_ptr<core::DeviceProbe> probe,
                      std::shared_ptr<events::AsyncEventPublisher> publisher,
                      std::shared_ptr<rmon::obs::Observer> observer, HealthMonitorOptions opts) {
    if (!probe)     return rmon_detail::unexpected(core::SetupError::MissingDeviceProbe);
    if (!publisher) return rmon_detail::unexpected(core::SetupError::MissingPublisher);
    if (opts.command_timeout.count() <= 0) return rmon_detail::unexpected(core::SetupError::InvalidConfig);
    if (!observer) observer = rmon::obs::default_observer();
    return std::unique_ptr<HealthMonitor>(
        new HealthMonitor(std::move(probe), std::move(publisher), std::move(observer), opts));
}

HealthMonitor::HealthMonitor(std::shared_ptr<core::DeviceProbe> probe,
                             std::shared_ptr<events::AsyncEventPublisher> publisher,
                             std::shared_ptr<rmon::obs::Observer> observer,
                             HealthMonitorOptions opts)
    : probe_(std::move(probe)), publisher_(std::move(publisher)), obs_(std::move(observer)),
      opts_(opts) {}

HealthMonitor::~HealthMonitor() { shutdown(); }

rmon_detail::expected<void, HealthError>
HealthMonitor::configure_health_check(const std::string& link_key, const HealthLinkConfig& cfg,
                                      std::stop_token scope) {
    std::lock_guard<std::mutex> cfg_lk(config_mu_);
    if (stopped_) return rmon_detail::unexpected(HealthError::Stopped);

    auto id = core::split_resource_key(link_key);
    if (!id) return rmon_detail::unexpected(HealthError::InvalidKey);

    const bool wanted = cfg.enabled && !cfg.targets.empty();
    if (wanted) {
        if (cfg.interval_sec == 0 || cfg.timeout_sec == 0 || cfg.failure_threshold == 0) {
            return rmon_detail::unexpected(HealthError::InvalidConfig);
        }
        const bool blank = std::any_of(cfg.targets.begin(), cfg.targets.end(),
                                       [](const std::string& t) { return t.empty(); });
        if (blank) return rmon_detail::unexpected(HealthError::InvalidConfig);
    }

    retire_link(link_key);

    if (!wanted) {
        if (auto r = remove_probes(*id, link_key, scope); !r) {
            rmon::obs::logger()->warn("health: leftover probes for {} not removed: {}", link_key,
                                      to_string(r.error()));
        }
        apply(link_key, *id, LinkStatus{});
        rmon::obs::logger()->info("health: monitoring disabled for {}", link_key);
        if (cfg.enabled) return rmon_detail::unexpected(HealthError::MissingTargets);
        return {};
    }

    // Remove first: an earlier add that timed out may still have landed on the device.
    auto removed = remove_probes(*id, link_key, scope);
    auto added   = removed ? add_probes(*id, link_key, cfg, scope) : removed;
    if (!added) {
        rmon::obs::logger()->warn("health: configuring {} failed: {}", link_key,
                                  to_string(added.error()));
        apply(link_key, *id, LinkStatus{});
        return rmon_detail::unexpected(added.error());
    }

    auto link = std::make_shared<Link>();
    link->key = link_key;
    link->id  = *id;
    link->cfg = cfg;
    link->worker = std::jthread([this, l = link.get()](std::stop_token st) { run(*l, st); });
    {
        std::lock_guard<std::mutex> lk(links_mu_);
        links_[link_key] = link;
    }
    {
        std::unique_lock<std::shared_mutex> lk(status_mu_);
        status_[link_key].monitoring = true;
    }
    rmon::obs::logger()->info("health: monitoring {} targets={} interval={}s", link_key,
                              cfg.targets.size(), cfg.interval_sec);
    return {};
}

HealthVerdict HealthMonitor::get_health_status(const std::string& link_key) const {
    std::shared_lock<std::shared_mutex> lk(status_mu_);
    auto it = status_.find(link_key);
    return it == status_.end() ? HealthVerdict::Unknown : it->second.verdict;
}

LinkStatus HealthMonitor::link_status(const std::string& link_key) const {
    std::shared_lock<std::shared_mutex> lk(status_mu_);
    auto it = status_.find(link_key);
    return it == status_.end() ? LinkStatus{} : it->second;
}

std::vector<std::string> HealthMonitor::monitored_links() const {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lk(links_mu_);
        keys.reserve(links_.size());
        for (const auto& [k, l] : links_) keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

rmon_detail::expected<HealthVerdict, HealthError>
HealthMonitor::check_now(const std::string& link_key, std::stop_token scope) {
    std::shared_ptr<Link> link;
    {
        std::lock_guard<std::mutex> lk(links_mu_);
        auto it = links_.find(link_key);
        if (it == links_.end()) return rmon_detail::unexpected(HealthError::InvalidKey);
        link = it->second;
    }
    return check(*link, scope);
}

void HealthMonitor::shutdown() {
    std::lock_guard<std::mutex> cfg_lk(config_mu_);
    stopped_ = true;
    std::vector<std::shared_ptr<Link>> all;
    {
        std::lock_guard<std::mutex> lk(links_mu_);
        for (auto& [k, l] : links_) all.push_back(std::move(l));
        links_.clear();
    }
    if (all.empty()) return;
    for (auto& l : all) l->worker.request_stop();
    for (auto& l : all) {
        if (l->worker.joinable()) l->worker.join();
        std::lock_guard<std::mutex> lk(l->check_mu);
        l->active = false;
    }
    {
        std::unique_lock<std::shared_mutex> lk(status_mu_);
        for (auto& [k, s] : status_) s.monitoring = false;
    }
    rmon::obs::logger()->info("health: stopped {} link loop(s)", all.size());
}

void HealthMonitor::retire_link(const std::string& key) {
    std::shared_ptr<Link> old;
    {
        std::lock_guard<std::mutex> lk(links_mu_);
        auto it = links_.find(key);
        if (it == links_.end()) return;
        old = std::move(it->second);
        links_.erase(it);
    }
    old->worker.request_stop();
    if (old->worker.joinable()) old->worker.join();
    std::lock_guard<std::mutex> lk(old->check_mu);
    old->active = false;
}

void HealthMonitor::run(Link& l, std::stop_token st) {
    const auto every = std::chrono::seconds(l.cfg.interval_sec);
    auto next = std::chrono::steady_clock::now() + every;
    while (core::sleep_until(st, next)) {
        auto v = check(l, st);
        if (!v && v.error() == HealthError::Cancelled) break;
        next += every;
        const auto now = std::chrono::steady_clock::now();
        if (next < now) next = now + every;
    }
}

rmon_detail::expected<HealthVerdict, HealthError> HealthMonitor::check(Link& l, std::stop_token st) {
    std::lock_guard<std::mutex> lk(l.check_mu);
    if (!l.active) return rmon_detail::unexpected(HealthError::InvalidKey);

    auto rows = core::run_command(*probe_, list_command(l.id, probe_tag(l.key)), st,
                                  opts_.command_timeout);
    if (!rows) {
        if (rows.error().code == core::ProbeErr::Cancelled) {
            return rmon_detail::unexpected(HealthError::Cancelled);
        }
        // Verdict is left as is; the next tick retries.
        obs_->record(Signal::ProbeFailure, l.key);
        rmon::obs::logger()->debug("health: check of {} failed: {} {}", l.key,
                                   core::to_string(rows.error().code), rows.error().message);
        return rmon_detail::unexpected(HealthError::DeviceCommandFailed);
    }

    LinkStatus next;
    next.total = static_cast<uint32_t>(rows->size());
    next.reachable = static_cast<uint32_t>(std::count_if(
        rows->begin(), rows->end(), [](const core::Record& r) {
            auto it = r.find("status");
            return it != r.end() && it->second == "up";
        }));
    next.verdict    = aggregate_health(next.reachable, next.total);
    next.monitoring = true;
    next.last_check = std::chrono::system_clock::now();
    const auto verdict = next.verdict;
    apply(l.key, l.id, std::move(next));
    return verdict;
}

rmon_detail::expected<void, HealthError>
HealthMonitor::remove_probes(const core::ResourceKey& id, const std::string& key,
                             std::stop_token st) {
    auto rows = core::run_command(*probe_, list_command(id, probe_tag(key)), st,
                                  opts_.command_timeout);
    if (!rows) return rmon_detail::unexpected(from_probe(rows.error()));

    for (const auto& row : *rows) {
        auto pid = row.find(".id");
        if (pid == row.end()) continue;
        core::Command rm{id.router_id, kNetwatch, "remove", {{".id", pid->second}}, {}};
        auto r = core::run_command(*probe_, rm, st, opts_.command_timeout);
        if (!r) {
            rmon::obs::logger()->warn("health: {} failed: {}", core::describe(rm), r.error().message);
            return rmon_detail::unexpected(from_probe(r.error()));
        }
    }
    return {};
}

rmon_detail::expected<void, HealthError>
HealthMonitor::add_probes(const core::ResourceKey& id, const std::string& key,
                          const HealthLinkConfig& cfg, std::stop_token st) {
    const std::string tag = probe_tag(key);
    for (const auto& target : cfg.targets) {
        core::Command add{id.router_id, kNetwatch, "add",
                          {{"host", target},
                           {"interval", std::to_string(cfg.interval_sec) + "s"},
                           {"timeout", std::to_string(cfg.timeout_sec) + "s"},
                           {"thr-loss-count", std::to_string(cfg.failure_threshold)},
                           {"comment", tag}},
                          {}};
        auto r = core::run_command(*probe_, add, st, opts_.command_timeout);
        if (!r) {
            rmon::obs::logger()->warn("health: adding probe {} for {} failed: {}", target, key,
                                      r.error().message);
            return rmon_detail::unexpected(from_probe(r.error()));
        }
    }
    return {};
}

void HealthMonitor::apply(const std::string& key, const core::ResourceKey& id, LinkStatus next) {
    HealthVerdict previous;
    {
        std::unique_lock<std::shared_mutex> lk(status_mu_);
        auto& cur = status_[key];
        previous  = cur.verdict;
        cur       = next;
    }
    if (previous == next.verdict) return;

    obs_->record(Signal::HealthTransition, key);
    rmon::obs::logger()->info("health: {} {} -> {} ({}/{} reachable)", key, to_string(previous),
                              to_string(next.verdict), next.reachable, next.total);

    events::Event e;
    e.type         = events::kWanHealthChanged;
    e.priority     = events::Priority::Normal;
    e.source       = "wan-health-monitor";
    e.timestamp    = next.last_check.value_or(std::chrono::system_clock::now());
    e.resource_key = key;
    e.payload      = transition_payload(key, id, previous, next);
    publisher_->enqueue(std::move(e));
}

} // namespace rmon::health
