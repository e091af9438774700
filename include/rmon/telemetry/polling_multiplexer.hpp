#pragma once
/**
 * @file polling_multiplexer.hpp
 * @brief Keyed polling sessions: one probe-and-broadcast loop per key, shared by any
 *        number of subscribers.
 *
 * Lifecycle per key:
 *  - First subscribe creates the session and starts its loop under the map lock.
 *  - The loop fetches at once, then every session interval.
 *  - Removing the last subscriber moves the session out of the map, stops its loop and
 *    joins it. A subscribe on the same key meanwhile waits for that join, so at most one
 *    loop per key ever runs.
 *
 * Locking:
 *  - mu_            : sessions_ / retiring_ membership. Never held across a probe call,
 *                     a broadcast or a join.
 *  - Session::subs_mu : the subscriber set (taken after mu_ when both are needed).
 *  - Session::join_mu : serializes joins of one session's worker.
 *
 * @tparam Point Data point type; broadcast as std::shared_ptr<const Point>.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rmon/compat/expected.hpp"
#include "rmon/config/constants.hpp"
#include "rmon/core/cancellation.hpp"
#include "rmon/core/device_probe.hpp"
#include "rmon/core/setup_error.hpp"
#include "rmon/events/async_publisher.hpp"
#include "rmon/mem/feed.hpp"
#include "rmon/obs/log.hpp"
#include "rmon/obs/observability.hpp"
#include "rmon/telemetry/point_source.hpp"

namespace rmon::telemetry {

/** @struct MultiplexerConfig
 *  @brief Interval bounds and queue sizing for one multiplexer instance.
 */
struct MultiplexerConfig {
    std::string               name{"multiplexer"}; ///< Log label
    std::chrono::milliseconds min_interval{1000};
    std::chrono::milliseconds max_interval{30000};
    std::chrono::milliseconds default_interval{5000};
    std::size_t               queue_capacity{rmon::config::constants::SUBSCRIBER_QUEUE_CAPACITY};
    std::chrono::milliseconds fetch_timeout{rmon::config::constants::PROBE_FETCH_TIMEOUT_MS};
};

/// True when bounds are ordered and every size is positive.
inline bool is_valid(const MultiplexerConfig& c) noexcept {
    return c.min_interval.count() > 0 && c.min_interval <= c.default_interval &&
           c.default_interval <= c.max_interval && c.queue_capacity > 0 &&
           c.fetch_timeout.count() > 0;
}

enum class SubscribeError : uint8_t {
    InvalidKey = 1, ///< The source factory rejected the key
    Cancelled,      ///< The caller's scope was already stopped
    Stopped         ///< stop() has been called
};

inline const char* to_string(SubscribeError e) noexcept {
    switch (e) {
        case SubscribeError::InvalidKey: return "invalid_key";
        case SubscribeError::Cancelled:  return "cancelled";
        case SubscribeError::Stopped:    return "stopped";
    }
    return "unknown";
}

template <class Point>
class PollingMultiplexer final {
public:
    using PointPtr  = std::shared_ptr<const Point>;
    using FeedT     = rmon::mem::Feed<PointPtr>;
    using FeedPtr   = std::shared_ptr<FeedT>;
    using PointHook = std::function<void(const std::string& key, const Point& p)>;

    /**
     * @brief Factory: validates capabilities and bounds.
     * @param observer Counter sink; null selects obs::default_observer().
     */
    static rmon_detail::expected<std::unique_ptr<PollingMultiplexer>, core::SetupError>
    create(MultiplexerConfig cfg,
           std::shared_ptr<core::DeviceProbe> probe,
           std::shared_ptr<events::AsyncEventPublisher> publisher,
           SourceFactory<Point> factory,
           std::shared_ptr<rmon::obs::Observer> observer = nullptr) {
        if (!probe)          return rmon_detail::unexpected(core::SetupError::MissingDeviceProbe);
        if (!publisher)      return rmon_detail::unexpected(core::SetupError::MissingPublisher);
        if (!factory)        return rmon_detail::unexpected(core::SetupError::MissingSourceFactory);
        if (!is_valid(cfg))  return rmon_detail::unexpected(core::SetupError::InvalidConfig);
        if (!observer) observer = rmon::obs::default_observer();
        return std::unique_ptr<PollingMultiplexer>(new PollingMultiplexer(
            std::move(cfg), std::move(probe), std::move(publisher), std::move(factory),
            std::move(observer)));
    }

    PollingMultiplexer(const PollingMultiplexer&)            = delete;
    PollingMultiplexer& operator=(const PollingMultiplexer&) = delete;

    ~PollingMultiplexer() { stop(); }

    /**
     * @brief Attach a new subscriber to @p key, creating the session if absent.
     * @param interval Requested cadence, clamped to the configured bounds; zero selects
     *                 the default. Ignored when the session already exists.
     * @param scope Subscriber lifetime; stopping it unsubscribes automatically.
     */
    rmon_detail::expected<FeedPtr, SubscribeError>
    subscribe(const std::string& key,
              std::chrono::milliseconds interval = std::chrono::milliseconds{0},
              std::stop_token scope = {}) {
        if (scope.stop_requested()) return rmon_detail::unexpected(SubscribeError::Cancelled);
        const auto cadence = clamp_interval(interval);

        FeedPtr feed;
        for (;;) {
            std::shared_ptr<Session> previous;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (stopped_) return rmon_detail::unexpected(SubscribeError::Stopped);

                if (auto r = retiring_.find(key); r != retiring_.end()) {
                    previous = r->second;
                } else {
                    std::shared_ptr<Session> session;
                    bool created = false;
                    if (auto it = sessions_.find(key); it != sessions_.end()) {
                        session = it->second;
                    } else {
                        auto source = factory_(key);
                        if (!source) return rmon_detail::unexpected(SubscribeError::InvalidKey);
                        session = std::make_shared<Session>(key, cadence, std::move(source));
                        created = true;
                    }
                    auto writer = rmon::mem::FeedWriter<PointPtr>::make(
                        next_feed_id_.fetch_add(1, std::memory_order_relaxed),
                        cfg_.queue_capacity);
                    feed = writer->feed();
                    {
                        std::lock_guard<std::mutex> sl(session->subs_mu);
                        session->subscribers.push_back(Subscriber{std::move(*writer), nullptr});
                    }
                    if (created) {
                        // Started only once its first subscriber is attached: the
                        // immediate fetch must reach the caller that opened the session.
                        sessions_.emplace(key, session);
                        start(*session);
                        rmon::obs::logger()->info("{}: session started key={} interval={}ms",
                                                  cfg_.name, key, cadence.count());
                    }
                    break;
                }
            }
            // Previous loop for this key is still exiting: wait for it outside the lock.
            // From that loop's own hook it cannot be awaited; the key stays unavailable.
            if (!previous->join()) return rmon_detail::unexpected(SubscribeError::Cancelled);
            forget_retired(key, previous);
        }

        // Registered outside every lock: the callback may run right here.
        auto on_cancel = std::make_unique<CancelCallback>(
            scope, std::function<void()>([this, key, weak = std::weak_ptr<FeedT>(feed)] {
                // unsubscribe() destroys this callback; work on copies.
                const std::string k = key;
                if (auto f = weak.lock()) unsubscribe(k, f);
            }));
        if (!attach_callback(key, feed, on_cancel)) {
            on_cancel.reset(); // subscriber already gone
        }
        if (scope.stop_requested()) return rmon_detail::unexpected(SubscribeError::Cancelled);
        return feed;
    }

    /**
     * @brief Detach @p feed from @p key and close it. Tears the session down (and joins
     *        its loop) when it was the last subscriber.
     * @return false if the feed is not subscribed to @p key.
     */
    bool unsubscribe(const std::string& key, const FeedPtr& feed) {
        if (!feed) return false;
        Subscriber removed;
        std::shared_ptr<Session> retired;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = sessions_.find(key);
            if (it == sessions_.end()) return false;
            {
                std::lock_guard<std::mutex> sl(it->second->subs_mu);
                auto& subs = it->second->subscribers;
                auto pos = std::find_if(subs.begin(), subs.end(), [&](const Subscriber& s) {
                    return s.writer.same_feed(feed.get());
                });
                if (pos == subs.end()) return false;
                removed = std::move(*pos);
                subs.erase(pos);
                if (subs.empty()) retired = it->second;
            }
            if (retired) {
                sessions_.erase(it);
                retiring_[key] = retired;
                retired->worker.request_stop();
            }
        }
        removed.writer.close();
        removed.on_cancel.reset();

        if (retired) {
            // Called from the session's own hook: the loop exits after this tick and
            // stays in retiring_ until the next subscribe on the key or stop() joins it.
            if (retired->join()) forget_retired(key, retired);
            rmon::obs::logger()->info("{}: session stopped key={}", cfg_.name, key);
        }
        return true;
    }

    /// Stop every loop, wait for all of them, close every feed. Idempotent.
    void stop() {
        std::vector<std::shared_ptr<Session>> all;
        {
            std::lock_guard<std::mutex> lk(mu_);
            stopped_ = true;
            for (auto& [k, s] : sessions_) all.push_back(s);
            for (auto& [k, s] : retiring_) all.push_back(s);
            sessions_.clear();
            retiring_.clear();
        }
        if (all.empty()) return;

        std::vector<Subscriber> subs;
        for (auto& s : all) {
            s->worker.request_stop();
            std::lock_guard<std::mutex> sl(s->subs_mu);
            for (auto& sub : s->subscribers) subs.push_back(std::move(sub));
            s->subscribers.clear();
        }
        for (auto& s : all) s->join();
        for (auto& sub : subs) sub.writer.close();
        subs.clear(); // deregisters cancel callbacks, outside every lock
        rmon::obs::logger()->info("{}: stopped {} session(s)", cfg_.name, all.size());
    }

    std::size_t session_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return sessions_.size();
    }

    std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::size_t n = 0;
        for (const auto& [k, s] : sessions_) {
            std::lock_guard<std::mutex> sl(s->subs_mu);
            n += s->subscribers.size();
        }
        return n;
    }

    /// Poll loop threads currently running, retiring sessions included.
    std::size_t running_loops() const noexcept { return running_loops_.load(std::memory_order_acquire); }

    /// Cadence of the live session for @p key.
    std::optional<std::chrono::milliseconds> session_interval(const std::string& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(key);
        if (it == sessions_.end()) return std::nullopt;
        return it->second->interval;
    }

    /// Wall-clock time of the last successful fetch for @p key.
    std::optional<std::chrono::system_clock::time_point> last_fetch(const std::string& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(key);
        if (it == sessions_.end()) return std::nullopt;
        const auto ms = it->second->last_fetch_ms.load(std::memory_order_acquire);
        if (ms == 0) return std::nullopt;
        return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
    }

    /**
     * @brief Called from the session loop after every broadcast (e.g. history ingestion).
     * @note The hook may unsubscribe, but must not call stop() or destroy the multiplexer.
     */
    void set_point_hook(PointHook hook) {
        auto h = hook ? std::make_shared<const PointHook>(std::move(hook)) : nullptr;
        std::lock_guard<std::mutex> lk(hook_mu_);
        hook_ = std::move(h);
    }

    std::chrono::milliseconds clamp_interval(std::chrono::milliseconds requested) const noexcept {
        if (requested.count() <= 0) return cfg_.default_interval;
        return std::clamp(requested, cfg_.min_interval, cfg_.max_interval);
    }

    const MultiplexerConfig& config() const noexcept { return cfg_; }

private:
    using CancelCallback = std::stop_callback<std::function<void()>>;

    struct Subscriber {
        rmon::mem::FeedWriter<PointPtr> writer;
        std::unique_ptr<CancelCallback> on_cancel;
    };

    struct Session {
        Session(std::string k, std::chrono::milliseconds iv, std::unique_ptr<PointSource<Point>> src)
            : key(std::move(k)), interval(iv), source(std::move(src)) {}

        /// false when called from the worker itself, which cannot join itself.
        bool join() {
            std::lock_guard<std::mutex> lk(join_mu);
            if (worker.get_id() == std::this_thread::get_id()) return false;
            if (worker.joinable()) worker.join();
            return true;
        }

        const std::string                   key;
        const std::chrono::milliseconds     interval;
        std::unique_ptr<PointSource<Point>> source; ///< Loop thread only
        std::atomic<int64_t>                last_fetch_ms{0};

        std::mutex              subs_mu;
        std::vector<Subscriber> subscribers;

        std::mutex   join_mu;
        std::jthread worker;
    };

    PollingMultiplexer(MultiplexerConfig cfg, std::shared_ptr<core::DeviceProbe> probe,
                       std::shared_ptr<events::AsyncEventPublisher> publisher,
                       SourceFactory<Point> factory, std::shared_ptr<rmon::obs::Observer> observer)
        : cfg_(std::move(cfg)), probe_(std::move(probe)), publisher_(std::move(publisher)),
          factory_(std::move(factory)), obs_(std::move(observer)) {}

    void start(Session& s) {
        s.worker = std::jthread([this, &s](std::stop_token st) { run(s, st); });
    }

    void run(Session& s, std::stop_token st) {
        running_loops_.fetch_add(1, std::memory_order_acq_rel);
        auto next = std::chrono::steady_clock::now();
        while (!st.stop_requested()) {
            poll_once(s, st);
            next += s.interval;
            const auto now = std::chrono::steady_clock::now();
            if (next < now) next = now + s.interval; // overran: skip missed ticks
            if (!core::sleep_until(st, next)) break;
        }
        running_loops_.fetch_sub(1, std::memory_order_acq_rel);
    }

    void poll_once(Session& s, std::stop_token st) {
        obs_->record(rmon::obs::Signal::Poll, s.key);
        const auto cmd  = s.source->command();
        auto       rows = core::run_command(*probe_, cmd, st, cfg_.fetch_timeout);
        if (!rows) {
            if (rows.error().code == core::ProbeErr::Cancelled) return;
            obs_->record(rmon::obs::Signal::ProbeFailure, s.key);
            rmon::obs::logger()->debug("{}: tick skipped key={} cmd={} reason={} {}", cfg_.name,
                                       s.key, core::describe(cmd),
                                       core::to_string(rows.error().code), rows.error().message);
            return;
        }
        if (rows->empty()) {
            obs_->record(rmon::obs::Signal::ProbeFailure, s.key);
            rmon::obs::logger()->debug("{}: tick skipped key={} reason=empty", cfg_.name, s.key);
            return;
        }

        const auto now   = std::chrono::system_clock::now();
        auto       built = s.source->build(*rows, now);
        if (!built) {
            obs_->record(rmon::obs::Signal::ProbeFailure, s.key);
            rmon::obs::logger()->debug("{}: tick skipped key={} reason=unparsable", cfg_.name,
                                       s.key);
            return;
        }
        s.last_fetch_ms.store(
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count(),
            std::memory_order_release);

        PointPtr point = std::make_shared<const Point>(std::move(*built));
        broadcast(s, point);

        std::shared_ptr<const PointHook> hook;
        {
            std::lock_guard<std::mutex> lk(hook_mu_);
            hook = hook_;
        }
        if (hook) (*hook)(s.key, *point);

        publisher_->enqueue(s.source->to_event(*point));
    }

    void broadcast(Session& s, const PointPtr& point) {
        std::vector<rmon::mem::FeedWriter<PointPtr>> targets;
        {
            std::lock_guard<std::mutex> sl(s.subs_mu);
            targets.reserve(s.subscribers.size());
            for (const auto& sub : s.subscribers) targets.push_back(sub.writer);
        }
        obs_->record(rmon::obs::Signal::PointBroadcast, s.key);
        for (const auto& w : targets) {
            if (!w.offer(point) && !w.feed()->closed()) {
                obs_->record(rmon::obs::Signal::UpdateDropped, s.key);
            }
        }
    }

    /// Hand the cancel callback to the subscriber entry; false if it is already gone.
    bool attach_callback(const std::string& key, const FeedPtr& feed,
                         std::unique_ptr<CancelCallback>& cb) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(key);
        if (it == sessions_.end()) return false;
        std::lock_guard<std::mutex> sl(it->second->subs_mu);
        for (auto& sub : it->second->subscribers) {
            if (sub.writer.same_feed(feed.get())) {
                sub.on_cancel = std::move(cb);
                return true;
            }
        }
        return false;
    }

    void forget_retired(const std::string& key, const std::shared_ptr<Session>& s) {
        std::lock_guard<std::mutex> lk(mu_);
        if (auto r = retiring_.find(key); r != retiring_.end() && r->second == s) retiring_.erase(r);
    }

    const MultiplexerConfig                      cfg_;
    std::shared_ptr<core::DeviceProbe>           probe_;
    std::shared_ptr<events::AsyncEventPublisher> publisher_;
    SourceFactory<Point>                         factory_;
    std::shared_ptr<rmon::obs::Observer>         obs_;

    mutable std::mutex                                        mu_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::unordered_map<std::string, std::shared_ptr<Session>> retiring_; ///< Stopped, not yet joined
    bool                                                      stopped_{false};
    std::atomic<uint64_t>                                     next_feed_id_{1};
    std::atomic<std::size_t>                                  running_loops_{0};

    std::mutex                       hook_mu_;
    std::shared_ptr<const PointHook> hook_;
};

} // namespace rmon::telemetry
