/**
 * @file feed.hpp
 * @brief Subscriber feed: read-only consumer handle over a bounded SubscriberQueue.
 *
 * Roles:
 *  - Feed<T>       : handed to the subscriber; drain-only (try_next / next).
 *  - FeedWriter<T> : kept by the session; the only way to offer or close.
 *
 * Guarantees:
 *  - offer() never blocks: a full queue drops that update for this feed only.
 *  - close() takes effect exactly once; nothing is written after it.
 *  - Elements queued before close() can still be drained.
 *  - One consumer thread per feed (SPSC).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

#include "rmon/config/constants.hpp"
#include "rmon/mem/subscriber_queue.hpp"

namespace rmon::mem {

template <class T> class FeedWriter;

template <class T>
class Feed final {
public:
  using value_type = T;

  Feed(const Feed&)            = delete;
  Feed& operator=(const Feed&) = delete;

  /// Pop one element if available.
  std::optional<T> try_next() {
    T v{};
    if (queue_.pop(v)) return v;
    return std::nullopt;
  }

  /**
   * @brief Block until an element arrives, the feed closes, or @p st is stopped.
   * @return The element, or std::nullopt on close (after draining) or cancellation.
   */
  std::optional<T> next(std::stop_token st) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, st, [this] { return !queue_.empty() || closed_.load(std::memory_order_acquire); });
    lk.unlock();
    return try_next();
  }

  /// As next(), bounded by @p timeout.
  template <class Rep, class Period>
  std::optional<T> next_for(std::stop_token st, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, st, timeout,
                 [this] { return !queue_.empty() || closed_.load(std::memory_order_acquire); });
    lk.unlock();
    return try_next();
  }

  bool        closed()   const noexcept { return closed_.load(std::memory_order_acquire); }
  uint64_t    dropped()  const noexcept { return dropped_.load(std::memory_order_relaxed); }
  uint64_t    id()       const noexcept { return id_; }
  std::size_t capacity() const noexcept { return queue_.capacity(); }
  std::size_t pending()  const noexcept { return queue_.approx_size(); }

private:
  friend class FeedWriter<T>;

  Feed(SubscriberQueue<T> q, uint64_t id) noexcept : queue_(std::move(q)), id_(id) {}

  /// Producer side; see FeedWriter.
  bool offer(T v) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_.load(std::memory_order_relaxed)) return false;
      if (!queue_.push(std::move(v))) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
      }
    }
    cv_.notify_one();
    return true;
  }

  bool close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_.exchange(true, std::memory_order_acq_rel)) return false;
    }
    cv_.notify_all();
    return true;
  }

  SubscriberQueue<T>          queue_;
  const uint64_t              id_;
  std::mutex                  mu_; ///< Serializes offer/close and guards consumer waits
  std::condition_variable_any cv_;
  std::atomic<bool>           closed_{false};
  std::atomic<uint64_t>       dropped_{0};
};

/** @class FeedWriter
 *  @brief Producer-side handle of one Feed.
 */
template <class T>
class FeedWriter final {
public:
  FeedWriter() = default;

  /**
   * @brief Create a feed and its writer.
   * @return std::nullopt if @p capacity is zero.
   */
  static std::optional<FeedWriter> make(
      uint64_t id, std::size_t capacity = rmon::config::constants::SUBSCRIBER_QUEUE_CAPACITY) {
    auto q = SubscriberQueue<T>::with_capacity(capacity);
    if (!q) return std::nullopt;
    FeedWriter w;
    w.feed_ = std::shared_ptr<Feed<T>>(new Feed<T>(std::move(*q), id));
    return w;
  }

  /// Non-blocking send; false if the feed is full (update dropped) or closed.
  bool offer(T v) const { return feed_ && feed_->offer(std::move(v)); }

  /// Close the feed; true only for the call that closed it.
  bool close() const { return feed_ && feed_->close(); }

  /// Read-only handle for the subscriber.
  std::shared_ptr<Feed<T>> feed() const noexcept { return feed_; }

  bool same_feed(const Feed<T>* f) const noexcept { return feed_.get() == f; }

private:
  std::shared_ptr<Feed<T>> feed_;
};

} // namespace rmon::mem
