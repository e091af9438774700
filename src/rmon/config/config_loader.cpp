/**
 * @file config_loader.cpp
 * @brief JSON loader (nlohmann::json) filling MonitorConfig over named defaults.
 */
#include "rmon/config/config_loader.hpp"

#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "rmon/core/resource_key.hpp"
#include "rmon/telemetry/interface_stats.hpp"
#include "rmon/telemetry/traffic_stats.hpp"

namespace rmon::config {

    using nlohmann::json;
    using namespace rmon::config::constants;

    namespace {

        /// Walks one JSON object; the first problem is kept and later reads become no-ops.
        class Reader {
        public:
            explicit Reader(std::optional<ConfigError>& err) : err_(err) {}

            bool ok() const noexcept { return !err_.has_value(); }

            void fail(std::string path, std::string message) {
                if (!err_) err_ = ConfigError{std::move(path), std::move(message)};
            }

            /// Object at @p key, or nullptr when absent (or on a type error).
            const json* object(const json& parent, const std::string& at, const char* key) {
                if (!ok() || !parent.contains(key)) return nullptr;
                const json& v = parent.at(key);
                if (!v.is_object()) {
                    fail(at + "/" + key, "expected an object");
                    return nullptr;
                }
                return &v;
            }

            template <class T>
            void field(const json& parent, const std::string& at, const char* key, T& out) {
                if (!ok() || !parent.contains(key)) return;
                const json& v = parent.at(key);
                const std::string path = at + "/" + key;
                if constexpr (std::is_same_v<T, bool>) {
                    if (!v.is_boolean()) return fail(path, "expected a boolean");
                    out = v.get<bool>();
                } else if constexpr (std::is_same_v<T, std::string>) {
                    if (!v.is_string()) return fail(path, "expected a string");
                    out = v.get<std::string>();
                } else if constexpr (std::is_integral_v<T>) {
                    if (!v.is_number_unsigned()) return fail(path, "expected a non-negative integer");
                    const auto raw = v.get<uint64_t>();
                    if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                        return fail(path, "value out of range");
                    }
                    out = static_cast<T>(raw);
                } else {
                    static_assert(std::is_integral_v<T>, "unsupported field type");
                }
            }

            template <class Rep, class Period>
            void duration(const json& parent, const std::string& at, const char* key,
                          std::chrono::duration<Rep, Period>& out) {
                uint64_t raw = static_cast<uint64_t>(out.count());
                field(parent, at, key, raw);
                out = std::chrono::duration<Rep, Period>(static_cast<Rep>(raw));
            }

            void strings(const json& parent, const std::string& at, const char* key,
                         std::vector<std::string>& out) {
                if (!ok() || !parent.contains(key)) return;
                const json& v = parent.at(key);
                const std::string path = at + "/" + key;
                if (!v.is_array()) return fail(path, "expected an array of strings");
                std::vector<std::string> items;
                for (const auto& item : v) {
                    if (!item.is_string()) return fail(path, "expected an array of strings");
                    items.push_back(item.get<std::string>());
                }
                out = std::move(items);
            }

        private:
            std::optional<ConfigError>& err_;
        };

        void read_multiplexer(Reader& r, const json& root, const char* key,
                              rmon::telemetry::MultiplexerConfig& c) {
            const std::string at = std::string("/") + key;
            const json* s = r.object(root, "", key);
            if (!s) return;
            r.duration(*s, at, "min_interval_ms", c.min_interval);
            r.duration(*s, at, "max_interval_ms", c.max_interval);
            r.duration(*s, at, "default_interval_ms", c.default_interval);
            r.field(*s, at, "queue_capacity", c.queue_capacity);
            r.duration(*s, at, "fetch_timeout_ms", c.fetch_timeout);
            if (r.ok() && !rmon::telemetry::is_valid(c)) {
                r.fail(at, "intervals must satisfy 0 < min <= default <= max; capacity and timeout > 0");
            }
        }

        void read_link(Reader& r, const json& v, const std::string& at,
                       rmon::health::HealthLinkConfig& link) {
            r.field(v, at, "enabled", link.enabled);
            r.strings(v, at, "targets", link.targets);
            r.field(v, at, "interval_sec", link.interval_sec);
            r.field(v, at, "timeout_sec", link.timeout_sec);
            r.field(v, at, "failure_threshold", link.failure_threshold);
            if (!r.ok() || !link.enabled) return;
            if (link.targets.empty()) return r.fail(at + "/targets", "enabled link needs at least one target");
            if (link.interval_sec == 0 || link.timeout_sec == 0 || link.failure_threshold == 0) {
                r.fail(at, "interval_sec, timeout_sec and failure_threshold must be positive");
            }
        }

        void read_health(Reader& r, const json& root, HealthSection& h) {
            const json* s = r.object(root, "", "health");
            if (!s) return;
            r.duration(*s, "/health", "command_timeout_ms", h.options.command_timeout);
            if (r.ok() && h.options.command_timeout.count() == 0) {
                r.fail("/health/command_timeout_ms", "must be positive");
            }
            const json* links = r.object(*s, "/health", "links");
            if (!links) return;
            for (const auto& [key, v] : links->items()) {
                const std::string at = "/health/links/" + key;
                if (!rmon::core::split_resource_key(key)) return r.fail(at, "link key must be routerID:wanID");
                if (!v.is_object()) return r.fail(at, "expected an object");
                rmon::health::HealthLinkConfig link;
                read_link(r, v, at, link);
                if (!r.ok()) return;
                h.links.emplace(key, std::move(link));
            }
        }

        void read_history(Reader& r, const json& root, HistorySection& h) {
            const json* s = r.object(root, "", "history");
            if (!s) return;
            auto& c = h.store;
            r.duration(*s, "/history", "hot_window_sec", c.hot_window);
            r.duration(*s, "/history", "warm_window_sec", c.warm_window);
            r.duration(*s, "/history", "warm_resolution_sec", c.warm_resolution);
            r.duration(*s, "/history", "cold_resolution_sec", c.cold_resolution);
            r.duration(*s, "/history", "cold_retention_sec", c.cold_retention);
            r.field(*s, "/history", "max_points", c.max_points);
            r.duration(*s, "/history", "compact_interval_sec", h.compact_interval);
            if (!r.ok()) return;
            if (c.hot_window.count() == 0 || c.warm_window <= c.hot_window ||
                c.cold_retention <= c.warm_window) {
                return r.fail("/history", "windows must satisfy 0 < hot < warm < cold retention");
            }
            if (c.warm_resolution.count() == 0 || c.cold_resolution < c.warm_resolution) {
                return r.fail("/history", "resolutions must satisfy 0 < warm <= cold");
            }
            if (c.max_points == 0) return r.fail("/history/max_points", "must be positive");
            if (h.compact_interval.count() == 0) return r.fail("/history/compact_interval_sec", "must be positive");
        }

        void read_logging(Reader& r, const json& root, rmon::obs::LogConfig& l) {
            const json* s = r.object(root, "", "logging");
            if (!s) return;
            r.field(*s, "/logging", "level", l.level);
            r.field(*s, "/logging", "pattern", l.pattern);
            if (!r.ok()) return;
            // from_str maps unknown names to "off".
            if (l.level != "off" && spdlog::level::from_str(l.level) == spdlog::level::off) {
                r.fail("/logging/level", "unknown level '" + l.level + "'");
            }
        }

        void read_events(Reader& r, const json& root, EventsSection& e) {
            const json* s = r.object(root, "", "events");
            if (!s) return;
            r.field(*s, "/events", "queue_capacity", e.queue_capacity);
            if (r.ok() && e.queue_capacity == 0) r.fail("/events/queue_capacity", "must be positive");
        }

    } // namespace

    MonitorConfig default_config() {
        MonitorConfig c;
        c.interface_stats = rmon::telemetry::interface_stats_defaults();
        c.traffic_stats   = rmon::telemetry::traffic_stats_defaults();
        return c;
    }

    rmon_detail::expected<MonitorConfig, ConfigError> Loader::load_from_string(const std::string& text) {
        const json root = json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (root.is_discarded()) return rmon_detail::unexpected(ConfigError{"", "malformed JSON"});
        if (!root.is_object())   return rmon_detail::unexpected(ConfigError{"", "top level must be an object"});

        MonitorConfig cfg = default_config();
        std::optional<ConfigError> err;
        Reader r(err);
        read_logging(r, root, cfg.logging);
        read_multiplexer(r, root, "interface_stats", cfg.interface_stats);
        read_multiplexer(r, root, "traffic_stats", cfg.traffic_stats);
        read_health(r, root, cfg.health);
        read_history(r, root, cfg.history);
        read_events(r, root, cfg.events);
        if (err) return rmon_detail::unexpected(std::move(*err));
        return cfg;
    }

    rmon_detail::expected<MonitorConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return rmon_detail::unexpected(ConfigError{path, "cannot open file"});
        std::ostringstream buf;
        buf << in.rdbuf();
        return load_from_string(buf.str());
    }

} // namespace rmon::config
