/**
 * @file simulated_probe.cpp
 * @brief Implementation of the simulated router.
 */
#include "rmon/core/simulated_probe.hpp"
#include "rmon/core/cancellation.hpp"
#include "rmon/config/constants.hpp"

#include <algorithm>

namespace rmon::core {

namespace {

void add(SimInterfaceCounters& a, const SimInterfaceCounters& b) noexcept {
    a.tx_bytes += b.tx_bytes;     a.rx_bytes += b.rx_bytes;
    a.tx_packets += b.tx_packets; a.rx_packets += b.rx_packets;
    a.tx_errors += b.tx_errors;   a.rx_errors += b.rx_errors;
    a.tx_drops += b.tx_drops;     a.rx_drops += b.rx_drops;
}

void add(SimServiceCounters& a, const SimServiceCounters& b) noexcept {
    a.tx_bytes += b.tx_bytes;     a.rx_bytes += b.rx_bytes;
    a.tx_packets += b.tx_packets; a.rx_packets += b.rx_packets;
}

ProbeResult ok(std::vector<Record> rows) {
    return ProbeResult{std::move(rows), true, {}};
}

ProbeResult fail(std::string msg) {
    return ProbeResult{{}, false, std::move(msg)};
}

} // namespace

ProbeResult SimulatedDeviceProbe::execute(const Command& cmd, const CallContext& ctx) {
    total_calls_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++calls_[cmd.path + " " + cmd.action];
    }

    // Latency is served before the lock so slow calls never serialize other callers.
    const auto latency = std::chrono::milliseconds(latency_ms_.load(std::memory_order_relaxed));
    if (latency.count() > 0) {
        const auto wake = std::chrono::steady_clock::now() + latency;
        if (!sleep_until(ctx.cancel, std::min(wake, ctx.deadline))) return fail("cancelled");
        if (wake > ctx.deadline) return fail("timeout");
    }

    switch (mode_.load(std::memory_order_relaxed)) {
        case SimMode::Error:    return fail("simulated device error");
        case SimMode::Rejected: return ProbeResult{{}, false, {}};
        case SimMode::Empty:    return ok({});
        case SimMode::Normal:   break;
    }

    if (cmd.path == "/interface")          return interfaces(cmd);
    if (cmd.path == "/ip/firewall/mangle") return mangle(cmd);
    if (cmd.path == "/tool/netwatch")      return netwatch_cmd(cmd);
    return fail("no such command: " + cmd.path);
}

ProbeResult SimulatedDeviceProbe::interfaces(const Command& cmd) {
    if (cmd.action != "print") return fail("unsupported action: " + cmd.action);
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Record> rows;
    auto rit = ifaces_.find(cmd.router_id);
    if (rit == ifaces_.end()) return ok(std::move(rows));
    for (auto& [id, iface] : rit->second) {
        const auto& c = iface.now;
        Record row{
            {".id", id}, {"name", id},
            {"tx-byte", std::to_string(c.tx_bytes)},     {"rx-byte", std::to_string(c.rx_bytes)},
            {"tx-packet", std::to_string(c.tx_packets)}, {"rx-packet", std::to_string(c.rx_packets)},
            {"tx-error", std::to_string(c.tx_errors)},   {"rx-error", std::to_string(c.rx_errors)},
            {"tx-drop", std::to_string(c.tx_drops)},     {"rx-drop", std::to_string(c.rx_drops)},
        };
        if (!matches(row, cmd.filter)) continue;
        rows.push_back(std::move(row));
        add(iface.now, iface.step);
    }
    return ok(std::move(rows));
}

ProbeResult SimulatedDeviceProbe::mangle(const Command& cmd) {
    if (cmd.action != "print") return fail("unsupported action: " + cmd.action);
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Record> rows;
    for (auto& [instance, svc] : services_) {
        const std::string comment = std::string(rmon::config::constants::SERVICE_MANGLE_TAG_PREFIX) + instance;
        Record in{{"comment", comment}, {"chain", "prerouting"},
                  {"bytes", std::to_string(svc.now.rx_bytes)},
                  {"packets", std::to_string(svc.now.rx_packets)}};
        Record out{{"comment", comment}, {"chain", "postrouting"},
                   {"bytes", std::to_string(svc.now.tx_bytes)},
                   {"packets", std::to_string(svc.now.tx_packets)}};
        if (!matches(in, cmd.filter)) continue;
        rows.push_back(std::move(in));
        rows.push_back(std::move(out));
        add(svc.now, svc.step);
    }
    return ok(std::move(rows));
}

ProbeResult SimulatedDeviceProbe::netwatch_cmd(const Command& cmd) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& table = watches_[cmd.router_id];

    if (cmd.action == "add") {
        auto host = cmd.args.find("host");
        if (host == cmd.args.end() || host->second.empty()) return fail("missing host");
        Watch w{"*" + std::to_string(next_id_++), cmd.args};
        table.push_back(std::move(w));
        return ok({Record{{"ret", table.back().id}}});
    }
    if (cmd.action == "remove") {
        auto id = cmd.args.find(".id");
        if (id == cmd.args.end()) return fail("missing .id");
        auto it = std::find_if(table.begin(), table.end(),
                               [&](const Watch& w) { return w.id == id->second; });
        if (it == table.end()) return fail("no such item: " + id->second);
        table.erase(it);
        return ok({});
    }
    if (cmd.action == "print") {
        std::vector<Record> rows;
        for (const auto& w : table) {
            Record row = w.args;
            row[".id"] = w.id;
            row["status"] = status_of(row["host"]);
            if (matches(row, cmd.filter)) rows.push_back(std::move(row));
        }
        return ok(std::move(rows));
    }
    return fail("unsupported action: " + cmd.action);
}

std::string SimulatedDeviceProbe::status_of(const std::string& host) const {
    auto it = reachable_.find(host);
    return (it == reachable_.end() || it->second) ? "up" : "down";
}

bool SimulatedDeviceProbe::matches(const Record& row, const std::map<std::string, std::string>& filter) {
    for (const auto& [k, v] : filter) {
        auto it = row.find(k);
        if (it == row.end() || it->second != v) return false;
    }
    return true;
}

void SimulatedDeviceProbe::set_interface(const std::string& router_id, const std::string& iface_id,
                                         const SimInterfaceCounters& c) {
    std::lock_guard<std::mutex> lk(mu_);
    ifaces_[router_id][iface_id].now = c;
}

void SimulatedDeviceProbe::set_interface_growth(const std::string& router_id, const std::string& iface_id,
                                                const SimInterfaceCounters& step) {
    std::lock_guard<std::mutex> lk(mu_);
    ifaces_[router_id][iface_id].step = step;
}

void SimulatedDeviceProbe::set_service(const std::string& instance_id, const SimServiceCounters& c) {
    std::lock_guard<std::mutex> lk(mu_);
    services_[instance_id].now = c;
}

void SimulatedDeviceProbe::set_service_growth(const std::string& instance_id, const SimServiceCounters& step) {
    std::lock_guard<std::mutex> lk(mu_);
    services_[instance_id].step = step;
}

void SimulatedDeviceProbe::set_host_reachable(const std::string& host, bool up) {
    std::lock_guard<std::mutex> lk(mu_);
    reachable_[host] = up;
}

std::size_t SimulatedDeviceProbe::calls(std::string_view path, std::string_view action) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = calls_.find(std::string(path) + " " + std::string(action));
    return it == calls_.end() ? 0 : it->second;
}

std::vector<Record> SimulatedDeviceProbe::netwatch(const std::string& router_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Record> rows;
    auto it = watches_.find(router_id);
    if (it == watches_.end()) return rows;
    for (const auto& w : it->second) {
        Record row = w.args;
        row[".id"] = w.id;
        row["status"] = status_of(row["host"]);
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace rmon::core
