/**
 * @file observability.cpp
 * @brief Atomic-counter implementation of Observer with spdlog trace lines.
 */
#include "rmon/obs/observability.hpp"
#include "rmon/obs/log.hpp"

#include <atomic>

namespace rmon::obs {

    namespace {

    class SimpleObserver final : public Observer {
    public:
        void record(Signal s, std::string_view key) override {
            slot(s).fetch_add(1, std::memory_order_relaxed);
            logger()->trace("signal={} key={}", to_string(s), key);
        }

        Counters snapshot() const override {
            Counters c;
            c.polls              = polls_.load(std::memory_order_relaxed);
            c.probe_failures     = probe_failures_.load(std::memory_order_relaxed);
            c.points_broadcast   = points_broadcast_.load(std::memory_order_relaxed);
            c.updates_dropped    = updates_dropped_.load(std::memory_order_relaxed);
            c.events_enqueued    = events_enqueued_.load(std::memory_order_relaxed);
            c.events_dropped     = events_dropped_.load(std::memory_order_relaxed);
            c.publish_failures   = publish_failures_.load(std::memory_order_relaxed);
            c.health_transitions = health_transitions_.load(std::memory_order_relaxed);
            return c;
        }

    private:
        std::atomic<uint64_t>& slot(Signal s) noexcept {
            switch (s) {
                case Signal::Poll:             return polls_;
                case Signal::ProbeFailure:     return probe_failures_;
                case Signal::PointBroadcast:   return points_broadcast_;
                case Signal::UpdateDropped:    return updates_dropped_;
                case Signal::EventEnqueued:    return events_enqueued_;
                case Signal::EventDropped:     return events_dropped_;
                case Signal::PublishFailure:   return publish_failures_;
                case Signal::HealthTransition: return health_transitions_;
            }
            return polls_;
        }

        std::atomic<uint64_t> polls_{0}, probe_failures_{0}, points_broadcast_{0},
                              updates_dropped_{0}, events_enqueued_{0}, events_dropped_{0},
                              publish_failures_{0}, health_transitions_{0};
    };

    } // namespace

    std::shared_ptr<Observer> make_simple_observer() {
        return std::make_shared<SimpleObserver>();
    }

    std::shared_ptr<Observer> default_observer() {
        static const std::shared_ptr<Observer> obs = make_simple_observer(); // process-wide
        return obs;
    }

    const char* to_string(Signal s) noexcept {
        switch (s) {
            case Signal::Poll:             return "poll";
            case Signal::ProbeFailure:     return "probe_failure";
            case Signal::PointBroadcast:   return "point_broadcast";
            case Signal::UpdateDropped:    return "update_dropped";
            case Signal::EventEnqueued:    return "event_enqueued";
            case Signal::EventDropped:     return "event_dropped";
            case Signal::PublishFailure:   return "publish_failure";
            case Signal::HealthTransition: return "health_transition";
        }
        return "unknown";
    }

} // namespace rmon::obs
