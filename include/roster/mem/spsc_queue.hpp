/**
 * @file spsc_queue.hpp
 * @brief Single-producer/single-consumer ring buffer (owning).
 *
 * Design goals:
 *  - Exception-free push/pop (return bool).
 *  - One-time allocation during setup via factory; no allocations after.
 *  - Minimal synchronization: acquire/release pairs for SPSC.
 *  - Indices padded to avoid false sharing.
 *
 * Slots are value-initialized at construction, so elements with owning
 * members (strings, sets) are always assigned into live objects.
 *
 * @tparam T Element type. Must be default-constructible and nothrow-movable.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "roster/compat/expected.hpp"  // roster_detail::expected / unexpected

namespace roster::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

/**
 * @brief Error codes reported by the factory (setup time only).
 */
enum class SpscError : std::uint8_t {
  CapacityZero = 1,          ///< Capacity must not be zero
  CapacityNotPowerOfTwo,     ///< Capacity must be power-of-two
  AllocationFailed           ///< Slot storage could not be allocated
};

/// @brief Constraint on element types: slots are assigned, never constructed in place.
template <class T>
struct SpscTraits {
  static constexpr bool ok =
    std::is_default_constructible_v<T> &&
    (std::is_trivially_copyable_v<T> || std::is_nothrow_move_assignable_v<T>);
};

/**
 * @brief Single-producer, single-consumer ring buffer (owning).
 *
 * @tparam T Element type.
 */
template <class T>
class SpscQueue final {
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "std::atomic<size_t> must be lock-free on this target");
  static_assert(SpscTraits<T>::ok,
                "SpscQueue<T> requires a default-constructible, nothrow-movable T");

public:
  using value_type = T;

  /// @brief Default-constructed empty shell (use with factory).
  SpscQueue() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once.
   * @param capacity_pow2 Ring capacity (power-of-two; one slot stays empty).
   * @return expected<SpscQueue, SpscError> constructed queue or error.
   */
  static roster_detail::expected<SpscQueue, SpscError>
  with_capacity(std::size_t capacity_pow2) noexcept {
    if (capacity_pow2 == 0) {
      return roster_detail::unexpected(SpscError::CapacityZero);
    }
    if ((capacity_pow2 & (capacity_pow2 - 1)) != 0) {
      return roster_detail::unexpected(SpscError::CapacityNotPowerOfTwo);
    }

    std::unique_ptr<T[]> storage(new (std::nothrow) T[capacity_pow2]());
    if (!storage) {
      return roster_detail::unexpected(SpscError::AllocationFailed);
    }

    SpscQueue q;
    q.capacity_ = capacity_pow2;
    q.mask_     = capacity_pow2 - 1;
    q.buf_      = std::move(storage);
    return q;
  }

  SpscQueue(const SpscQueue&)            = delete; ///< Non-copyable
  SpscQueue& operator=(const SpscQueue&) = delete; ///< Non-assignable

  /// @brief Move constructor (only while no producer/consumer is active).
  SpscQueue(SpscQueue&& other) noexcept { move_from(std::move(other)); }

  /// @brief Move assignment (only while no producer/consumer is active).
  SpscQueue& operator=(SpscQueue&& other) noexcept {
    if (this != &other) move_from(std::move(other));
    return *this;
  }

  /**
   * @brief Push by const reference (producer thread only).
   * @return false if queue is full.
   */
  bool push(const T& v) noexcept(std::is_nothrow_copy_assignable_v<T>) {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & mask_;
    if (n == head_.load(std::memory_order_acquire)) {
      return false; // full
    }
    buf_[t] = v;
    tail_.store(n, std::memory_order_release);
    return true;
  }

  /**
   * @brief Push by rvalue reference (producer thread only).
   * @return false if queue is full; @p v is left untouched.
   */
  bool push(T&& v) noexcept {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & mask_;
    if (n == head_.load(std::memory_order_acquire)) {
      return false; // full
    }
    buf_[t] = std::move(v);
    tail_.store(n, std::memory_order_release);
    return true;
  }

  /**
   * @brief Pop one element into output (consumer thread only).
   * @return false if queue is empty.
   */
  bool pop(T& out) noexcept {
    const std::size_t h = head_.load(std::memory_order_relaxed);
    if (h == tail_.load(std::memory_order_acquire)) {
      return false; // empty
    }
    out = std::move(buf_[h]);
    head_.store((h + 1) & mask_, std::memory_order_release);
    return true;
  }

  /// @brief True if queue is empty (observer).
  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  /// @brief True if queue is full (observer).
  bool full() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    return ((t + 1) & mask_) == head_.load(std::memory_order_acquire);
  }

  /// @brief Capacity (power-of-two).
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
    capacity_  = other.capacity_;
    mask_      = other.mask_;
    buf_       = std::move(other.buf_);
    other.capacity_ = 0;
    other.mask_ = 0;
  }

  // Producer/consumer indices on separate cache lines (avoid false sharing)
  alignas(kCacheLine) std::atomic<std::size_t> head_{0}; ///< Consumer index
  alignas(kCacheLine) std::atomic<std::size_t> tail_{0}; ///< Producer index

  alignas(kCacheLine) std::unique_ptr<T[]> buf_;   ///< Slot storage
  std::size_t                              capacity_ = 0;
  std::size_t                              mask_     = 0;
};

} // namespace roster::mem
