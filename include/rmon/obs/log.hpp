#pragma once
/**
 * @file log.hpp
 * @brief Named spdlog logger shared by every rmon component.
 */

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "rmon/config/constants.hpp"

namespace rmon::obs {

    /** @struct LogConfig
     *  @brief Logger level and line pattern (spdlog syntax).
     */
    struct LogConfig {
        std::string level{rmon::config::constants::LOG_DEFAULT_LEVEL};     ///< trace..critical, off
        std::string pattern{rmon::config::constants::LOG_DEFAULT_PATTERN}; ///< spdlog pattern
    };

    /**
     * @brief (Re)configure the "rmon" logger.
     * @return false if @p cfg.level is not a known spdlog level (the level is left unchanged).
     */
    bool init_logging(const LogConfig& cfg);

    /// The "rmon" logger; created with defaults on first use.
    std::shared_ptr<spdlog::logger> logger();

} // namespace rmon::obs
