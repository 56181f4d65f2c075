/**
 * @file spsc_queue.hpp
 * @brief Bounded single-producer/single-consumer ring carrying probe samples.
 *
 * Each probe thread owns the producer side of one ring; the ingestion thread is
 * the only consumer of every ring, so verdict state has a single writer and
 * probes never share a lock.
 *
 *  - push() never blocks: a full ring rejects the element and counts the drop.
 *  - drain() hands every visible element to the consumer and publishes the new
 *    head once per batch.
 *  - Storage is allocated once by with_capacity(); nothing allocates afterwards.
 *  - Head and tail sit on separate cache lines.
 *
 * Slots are value-initialized at construction, so push/pop assign into live
 * objects; T must be default constructible and nothrow move-assignable.
 *
 * @tparam T Element type.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "drguard/compat/expected.hpp"  // drguard_detail::expected / unexpected

namespace drguard::mem {

/// Cache line size assumed for index padding.
inline constexpr std::size_t kCacheLine = 64;

/**
 * @brief Error codes reported by the factory (setup time only).
 * These errors are never produced during push/pop.
 */
enum class SpscError : std::uint8_t {
  CapacityZero = 1,          ///< Capacity must not be zero
  CapacityNotPowerOfTwo,     ///< Capacity must be power-of-two
  AllocationFailed,          ///< Slot allocation failed
  ElementNotNothrowMovable   ///< T must be nothrow move-assignable
};

/// @brief Trait to constrain element types.
template <class T>
struct SpscTraits {
  static constexpr bool ok =
    std::is_default_constructible_v<T> &&
    (std::is_trivially_copyable_v<T> || std::is_nothrow_move_assignable_v<T>);
};

/**
 * @brief Owning SPSC ring. One probe thread produces, the ingestion thread consumes.
 */
template <class T>
class SpscQueue final {
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "std::atomic<size_t> must be lock-free on this target");

public:
  using value_type = T;

  /// @brief Empty shell with no storage; obtain usable rings from with_capacity().
  SpscQueue() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once.
   * @param capacity_pow2 Ring capacity (must be power-of-two, >= 2 recommended).
   * @return expected<SpscQueue, SpscError> constructed queue or error.
   */
  static drguard_detail::expected<SpscQueue, SpscError>
  with_capacity(std::size_t capacity_pow2) noexcept {
    if (capacity_pow2 == 0) {
      return drguard_detail::unexpected(SpscError::CapacityZero);
    }
    if ((capacity_pow2 & (capacity_pow2 - 1)) != 0) {
      return drguard_detail::unexpected(SpscError::CapacityNotPowerOfTwo);
    }
    if (!SpscTraits<T>::ok) {
      return drguard_detail::unexpected(SpscError::ElementNotNothrowMovable);
    }

    std::unique_ptr<T[]> storage(new (std::nothrow) T[capacity_pow2]());
    if (!storage) {
      return drguard_detail::unexpected(SpscError::AllocationFailed);
    }

    SpscQueue q;
    q.capacity_ = capacity_pow2;
    q.mask_     = capacity_pow2 - 1;
    q.buf_      = std::move(storage);
    return q;
  }

  SpscQueue(const SpscQueue&)            = delete; ///< Non-copyable
  SpscQueue& operator=(const SpscQueue&) = delete; ///< Non-assignable

  /// @brief Move constructor (never move a ring that threads are using).
  SpscQueue(SpscQueue&& other) noexcept { move_from(std::move(other)); }

  /// @brief Move assignment (never move a ring that threads are using).
  SpscQueue& operator=(SpscQueue&& other) noexcept {
    if (this != &other) move_from(std::move(other));
    return *this;
  }

  /**
   * @brief Producer side. Copies or moves @p v into the next free slot.
   * @return false if the ring is full; the element is dropped and counted.
   */
  template <class U>
  bool push(U&& v) noexcept(std::is_nothrow_assignable_v<T&, U&&>) {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & mask_;
    if (n == head_.load(std::memory_order_acquire)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    buf_[t] = std::forward<U>(v);
    tail_.store(n, std::memory_order_release);
    return true;
  }

  /**
   * @brief Pop one element into output.
   * @return false if queue is empty.
   */
  bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
    const std::size_t h = head_.load(std::memory_order_relaxed);
    if (h == tail_.load(std::memory_order_acquire)) {
      return false; // empty
    }
    out = std::move(buf_[h]);
    head_.store((h + 1) & mask_, std::memory_order_release);
    return true;
  }

  /**
   * @brief Consumer side. Passes every element visible at entry to @p fn, oldest first.
   * @param fn Called as fn(T&&); must not throw.
   * @return Number of elements consumed.
   */
  template <class Fn>
  std::size_t drain(Fn&& fn) {
    std::size_t h = head_.load(std::memory_order_relaxed);
    const std::size_t t = tail_.load(std::memory_order_acquire);
    std::size_t n = 0;
    for (; h != t; h = (h + 1) & mask_, ++n) fn(std::move(buf_[h]));
    if (n != 0) head_.store(h, std::memory_order_release);
    return n;
  }

  /// @brief Elements rejected by push() because the ring was full.
  std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

  /// @brief True if the ring holds nothing (observer).
  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  /// @brief True if the next push() would be dropped (observer).
  bool full() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    return ((t + 1) & mask_) == head_.load(std::memory_order_acquire);
  }

  /// @brief Capacity (power-of-two). Usable slots are capacity() - 1.
  std::size_t capacity() const noexcept { return capacity_; }

  /// @brief Approximate size (not linearizable across threads).
  std::size_t approx_size() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    const auto h = head_.load(std::memory_order_acquire);
    return (t + capacity_ - h) & mask_;
  }

private:
  void move_from(SpscQueue&& other) noexcept {
    head_.store(other.head_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    tail_.store(other.tail_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    dropped_.store(other.dropped_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    capacity_  = other.capacity_;
    mask_      = other.mask_;
    buf_       = std::move(other.buf_);
    other.capacity_ = 0;
    other.mask_ = 0;
    other.head_.store(0, std::memory_order_relaxed);
    other.tail_.store(0, std::memory_order_relaxed);
    other.dropped_.store(0, std::memory_order_relaxed);
  }

  // Producer/consumer indices on separate cache lines (avoid false sharing)
  alignas(kCacheLine) std::atomic<std::size_t> head_{0}; ///< Consumer index
  alignas(kCacheLine) std::atomic<std::size_t> tail_{0}; ///< Producer index
  std::atomic<std::uint64_t>                   dropped_{0}; ///< Written by the producer only

  // Read-mostly metadata and owning storage
  alignas(kCacheLine) std::unique_ptr<T[]> buf_;  ///< Value-initialized slots
  std::size_t                              capacity_ = 0; ///< Capacity (power-of-two)
  std::size_t                              mask_     = 0; ///< capacity_-1
};

} // namespace drguard::mem
