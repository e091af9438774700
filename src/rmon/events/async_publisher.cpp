/**
 * @file async_publisher.cpp
 * @brief Delivery thread and bounded queue of AsyncEventPublisher.
 */
#include "rmon/events/async_publisher.hpp"
#include "rmon/obs/log.hpp"

#include <utility>

namespace rmon::events {

using rmon::obs::Signal;

rmon_detail::expected<std::shared_ptr<AsyncEventPublisher>, SetupError>
AsyncEventPublisher::create(std::shared_ptr<EventSink> sink, std::size_t capacity,
                            std::shared_ptr<rmon::obs::Observer> observer) {
    if (!sink)         return rmon_detail::unexpected(SetupError::MissingEventSink);
    if (capacity == 0) return rmon_detail::unexpected(SetupError::InvalidConfig);
    if (!observer) observer = rmon::obs::default_observer();
    return std::shared_ptr<AsyncEventPublisher>(
        new AsyncEventPublisher(std::move(sink), capacity, std::move(observer)));
}

AsyncEventPublisher::AsyncEventPublisher(std::shared_ptr<EventSink> sink, std::size_t capacity,
                                         std::shared_ptr<rmon::obs::Observer> observer)
    : sink_(std::move(sink)), obs_(std::move(observer)), capacity_(capacity) {
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

AsyncEventPublisher::~AsyncEventPublisher() { stop(); }

bool AsyncEventPublisher::enqueue(Event e) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopped_ || queue_.size() >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            obs_->record(Signal::EventDropped, e.resource_key);
            rmon::obs::logger()->warn("event dropped: type={} key={} pending={}",
                                      e.type, e.resource_key, queue_.size());
            return false;
        }
        queue_.push_back(std::move(e));
    }
    cv_.notify_one();
    obs_->record(Signal::EventEnqueued, {});
    return true;
}

void AsyncEventPublisher::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopped_ = true;
    }
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

std::size_t AsyncEventPublisher::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

void AsyncEventPublisher::run(std::stop_token st) {
    for (;;) {
        Event e;
        {
            std::unique_lock<std::mutex> lk(mu_);
            // Returns early on stop; whatever is still queued is drained before exit.
            cv_.wait(lk, st, [this] { return !queue_.empty(); });
            if (queue_.empty()) return;
            e = std::move(queue_.front());
            queue_.pop_front();
        }
        deliver(e);
    }
}

void AsyncEventPublisher::deliver(const Event& e) {
    auto r = sink_->publish(e);
    delivered_.fetch_add(1, std::memory_order_relaxed);
    if (!r) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        obs_->record(Signal::PublishFailure, e.resource_key);
        rmon::obs::logger()->warn("event publish failed: type={} key={} error={}",
                                  e.type, e.resource_key, r.error().message);
    }
}

} // namespace rmon::events
