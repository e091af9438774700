#pragma once
/**
 * @file point_source.hpp
 * @brief Per-session strategy of a PollingMultiplexer: which command to run and how to
 *        turn its records into one data point.
 */

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rmon/core/device_probe.hpp"
#include "rmon/events/event.hpp"

namespace rmon::telemetry {

/** @class PointSource
 *  @brief Stateful builder owned by exactly one session (called from its loop thread only).
 *  @tparam Point Immutable data point type broadcast to subscribers.
 */
template <class Point>
class PointSource {
public:
    virtual ~PointSource() = default;

    /// Command issued on every tick.
    virtual core::Command command() const = 0;

    /**
     * @brief Build a point from a successful, non-empty result.
     * @return std::nullopt if the rows lack the expected counters (tick is skipped).
     */
    virtual std::optional<Point> build(const std::vector<core::Record>& rows,
                                       std::chrono::system_clock::time_point now) = 0;

    /// Event forwarded to the EventSink for a broadcast point.
    virtual events::Event to_event(const Point& p) const = 0;
};

/// Creates the source for a session key; returns null for a malformed key.
template <class Point>
using SourceFactory = std::function<std::unique_ptr<PointSource<Point>>(const std::string& key)>;

} // namespace rmon::telemetry
