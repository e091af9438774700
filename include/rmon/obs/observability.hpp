#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: process counters for polling, delivery and health.
 * @details Components record signals; the backing implementation keeps counters and
 *          writes debug lines through the spdlog logger (see log.hpp).
 */

#include <cstdint>
#include <memory>
#include <string_view>

namespace rmon::obs {

    /** @enum Signal
     *  @brief Countable occurrences reported by the telemetry components.
     */
    enum class Signal : uint8_t {
        Poll,              ///< A poll tick ran a device command
        ProbeFailure,      ///< A poll tick was skipped (error, rejection, empty, timeout)
        PointBroadcast,    ///< A data point was offered to a session's subscribers
        UpdateDropped,     ///< A subscriber queue was full; that update was dropped for it
        EventEnqueued,     ///< An event entered the outbound queue
        EventDropped,      ///< The outbound queue was full
        PublishFailure,    ///< The event sink rejected an event
        HealthTransition   ///< A link verdict changed
    };

    /** @struct Counters
     *  @brief Process-level counters, one per Signal.
     */
    struct Counters {
        uint64_t polls{0};
        uint64_t probe_failures{0};
        uint64_t points_broadcast{0};
        uint64_t updates_dropped{0};
        uint64_t events_enqueued{0};
        uint64_t events_dropped{0};
        uint64_t publish_failures{0};
        uint64_t health_transitions{0};
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record one occurrence of @p s for the resource @p key (may be empty).
        virtual void record(Signal s, std::string_view key) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Fresh counting observer (one per component in tests, shared in apps).
    std::shared_ptr<Observer> make_simple_observer();

    /// Process-wide observer used when a component is created without one.
    std::shared_ptr<Observer> default_observer();

    /// Label used in log lines.
    const char* to_string(Signal s) noexcept;

} // namespace rmon::obs
