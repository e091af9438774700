/**
 * @file subscriber_queue.hpp
 * @brief Bounded single-producer/single-consumer ring used as one subscriber's delivery queue.
 *
 * Design goals:
 *  - Non-blocking hot path (push/pop return bool); a full queue rejects the element.
 *  - One-time allocation during setup via factory; no allocations after.
 *  - Minimal synchronization: acquire/release pairs for SPSC.
 *  - Any capacity >= 1 (one spare slot distinguishes full from empty).
 *
 * Roles:
 *  - Producer: the session's poll loop.
 *  - Consumer: the subscriber that owns the Feed.
 *
 * @tparam T Element type. Must be nothrow-movable.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

#include "rmon/compat/expected.hpp"  // rmon_detail::expected / unexpected

namespace rmon::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

/**
 * @brief Error codes reported by the factory (setup time only).
 */
enum class QueueError : std::uint8_t {
  CapacityZero = 1,          ///< Capacity must not be zero
  ElementNotNothrowMovable   ///< T must be nothrow-movable
};

template <class T>
class SubscriberQueue final {
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "std::atomic<size_t> must be lock-free on this target");

public:
  using value_type = T;

  SubscriberQueue() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once.
   * @param capacity Maximum number of queued elements.
   */
  static rmon_detail::expected<SubscriberQueue, QueueError>
  with_capacity(std::size_t capacity) {
    if (capacity == 0) {
      return rmon_detail::unexpected(QueueError::CapacityZero);
    }
    if (!std::is_nothrow_move_constructible_v<T> || !std::is_nothrow_move_assignable_v<T>) {
      return rmon_detail::unexpected(QueueError::ElementNotNothrowMovable);
    }
    SubscriberQueue q;
    q.slots_    = capacity + 1;
    q.capacity_ = capacity;
    q.buf_      = std::make_unique<T[]>(q.slots_);
    return q;
  }

  SubscriberQueue(const SubscriberQueue&)            = delete;
  SubscriberQueue& operator=(const SubscriberQueue&) = delete;

  SubscriberQueue(SubscriberQueue&& other) noexcept { move_from(std::move(other)); }
  SubscriberQueue& operator=(SubscriberQueue&& other) noexcept {
    if (this != &other) move_from(std::move(other));
    return *this;
  }

  /**
   * @brief Push by rvalue reference (producer only).
   * @return false if the queue is full; @p v is left untouched.
   */
  bool push(T&& v) noexcept {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = next(t);
    if (n == head_.load(std::memory_order_acquire)) {
      return false; // full
    }
    buf_[t] = std::move(v);
    tail_.store(n, std::memory_order_release);
    return true;
  }

  bool push(const T& v) {
    T copy = v;
    return push(std::move(copy));
  }

  /**
   * @brief Pop one element (consumer only).
   * @return false if the queue is empty.
   */
  bool pop(T& out) noexcept {
    const std::size_t h = head_.load(std::memory_order_relaxed);
    if (h == tail_.load(std::memory_order_acquire)) {
      return false; // empty
    }
    out = std::move(buf_[h]);
    buf_[h] = T{}; // release payload references held by the slot
    head_.store(next(h), std::memory_order_release);
    return true;
  }

  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  bool full() const noexcept {
    return next(tail_.load(std::memory_order_acquire)) == head_.load(std::memory_order_acquire);
  }

  std::size_t capacity() const noexcept { return capacity_; }

  /// Approximate size (not linearizable across threads).
  std::size_t approx_size() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    const auto h = head_.load(std::memory_order_acquire);
    return (t + slots_ - h) % (slots_ == 0 ? 1 : slots_);
  }

private:
  std::size_t next(std::size_t i) const noexcept { return (i + 1 == slots_) ? 0 : i + 1; }

  void move_from(SubscriberQueue&& other) noexcept {
    head_.store(other.head_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    tail_.store(other.tail_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    buf_      = std::move(other.buf_);
    slots_    = other.slots_;
    capacity_ = other.capacity_;
    other.slots_ = 0;
    other.capacity_ = 0;
  }

  // Producer/consumer indices on separate cache lines (avoid false sharing)
  alignas(kCacheLine) std::atomic<std::size_t> head_{0}; ///< Consumer index
  alignas(kCacheLine) std::atomic<std::size_t> tail_{0}; ///< Producer index

  alignas(kCacheLine) std::unique_ptr<T[]> buf_{};
  std::size_t                              slots_    = 0; ///< capacity_ + 1
  std::size_t                              capacity_ = 0;
};

} // namespace rmon::mem
