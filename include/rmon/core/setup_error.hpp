#pragma once
/**
 * @file setup_error.hpp
 * @brief Construction-time errors returned by component factories.
 * @details A missing capability is fatal for the component being built, never a per-call error.
 */

#include <cstdint>

namespace rmon::core {

enum class SetupError : uint8_t {
    MissingDeviceProbe = 1, ///< DeviceProbe is null
    MissingEventSink,       ///< EventSink is null
    MissingPublisher,       ///< AsyncEventPublisher is null
    MissingSourceFactory,   ///< Point source factory is empty
    MissingTier,            ///< One of hot/warm/cold tiers is null
    InvalidConfig           ///< Bounds or capacities are inconsistent
};

inline const char* to_string(SetupError e) noexcept {
    switch (e) {
        case SetupError::MissingDeviceProbe:   return "missing_device_probe";
        case SetupError::MissingEventSink:     return "missing_event_sink";
        case SetupError::MissingPublisher:     return "missing_publisher";
        case SetupError::MissingSourceFactory: return "missing_source_factory";
        case SetupError::MissingTier:          return "missing_tier";
        case SetupError::InvalidConfig:        return "invalid_config";
    }
    return "unknown";
}

} // namespace rmon::core
