/**
 * @file log.cpp
 * @brief stderr color sink for the "rmon" logger.
 */
#include "rmon/obs/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rmon::obs {

    using rmon::config::constants::LOGGER_NAME;

    std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> log;
        std::call_once(once, [] {
            log = spdlog::get(LOGGER_NAME);
            if (!log) {
                log = spdlog::stderr_color_mt(LOGGER_NAME);
                log->set_pattern(rmon::config::constants::LOG_DEFAULT_PATTERN);
                log->set_level(spdlog::level::from_str(rmon::config::constants::LOG_DEFAULT_LEVEL));
            }
        });
        return log;
    }

    bool init_logging(const LogConfig& cfg) {
        auto log = logger();
        // from_str maps unknown names to "off"; only accept "off" when asked for it.
        const auto lvl = spdlog::level::from_str(cfg.level);
        const bool known = lvl != spdlog::level::off || cfg.level == "off";
        if (known) log->set_level(lvl);
        if (!cfg.pattern.empty()) log->set_pattern(cfg.pattern);
        return known;
    }

} // namespace rmon::obs
