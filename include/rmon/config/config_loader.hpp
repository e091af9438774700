#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: JSON file or string -> MonitorConfig.
 * @details Every key is optional; a missing key keeps the default from constants.hpp.
 *          Present keys must have the right JSON type and pass validation.
 */

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

#include "rmon/compat/expected.hpp"
#include "rmon/config/constants.hpp"
#include "rmon/health/health_monitor.hpp"
#include "rmon/history/tiered_store.hpp"
#include "rmon/obs/log.hpp"
#include "rmon/telemetry/polling_multiplexer.hpp"

namespace rmon::config {

    /** @struct HealthSection
     *  @brief Monitor options plus links configured at startup, keyed "routerID:wanID".
     */
    struct HealthSection {
        rmon::health::HealthMonitorOptions                      options;
        std::map<std::string, rmon::health::HealthLinkConfig>   links;
    };

    struct HistorySection {
        rmon::history::HistoryConfig store;
        std::chrono::seconds compact_interval{constants::HISTORY_COMPACT_INTERVAL_SEC};
    };

    struct EventsSection {
        std::size_t queue_capacity{constants::EVENT_QUEUE_CAPACITY};
    };

    /** @struct MonitorConfig
     *  @brief Aggregate of every component's configuration.
     */
    struct MonitorConfig {
        rmon::obs::LogConfig                logging;
        rmon::telemetry::MultiplexerConfig  interface_stats;
        rmon::telemetry::MultiplexerConfig  traffic_stats;
        HealthSection                       health;
        HistorySection                      history;
        EventsSection                       events;
    };

    /** @struct ConfigError
     *  @brief Where loading stopped and why.
     */
    struct ConfigError {
        std::string path;    ///< JSON pointer-like location, e.g. "/health/links/r1:wan1/targets"
        std::string message;
    };

    /// Defaults for every section.
    MonitorConfig default_config();

    /** @class Loader
     *  @brief Source of monitor configuration.
     */
    class Loader {
    public:
        /**
         * @brief Read and parse a JSON file.
         * @return ConfigError for an unreadable file, malformed JSON, a wrongly typed key or
         *         a value that fails validation.
         */
        static rmon_detail::expected<MonitorConfig, ConfigError> load_from_file(const std::string& path);

        /// As load_from_file() for in-memory JSON text.
        static rmon_detail::expected<MonitorConfig, ConfigError> load_from_string(const std::string& text);
    };

} // namespace rmon::config
