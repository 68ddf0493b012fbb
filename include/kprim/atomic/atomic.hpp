/**
 * @file atomic.hpp
 * @brief Single-word atomic store/load on plain memory with an explicit, per-operation ordering.
 *
 * Design:
 *  - The ordering is a property of one operation, not of the location: the same word may be
 *    stored relaxed in one place and releasing in another.
 *  - Implemented over std::atomic_ref, so the location stays a plain T (it can live inside a
 *    mapped Region or a C struct).
 *  - Never blocks, never fails.
 *
 * Pairing:
 *  - store(..., Releasing) on thread A + load(..., Acquiring) on thread B that observes the
 *    value => B also observes every write A made before the store.
 *  - Relaxed gives atomicity only (no tearing), no visibility of surrounding writes.
 *  - Ordering, not mutual exclusion: concurrent writers still need their own arbitration.
 *
 * @tparam T Trivially copyable, aligned to std::atomic_ref<T>::required_alignment.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <type_traits>

namespace kprim::atomic {

/// @brief Ordering of a single atomic store.
enum class StoreOrdering : std::uint8_t {
  Relaxed = 0,   ///< Atomicity only
  Releasing = 1  ///< Publishes prior writes to a matching acquiring load
};

/// @brief Ordering of a single atomic load.
enum class LoadOrdering : std::uint8_t {
  Relaxed = 0,   ///< Atomicity only
  Acquiring = 1  ///< Observes writes published by the matching releasing store
};

constexpr std::memory_order to_memory_order(StoreOrdering o) noexcept {
  return o == StoreOrdering::Releasing ? std::memory_order_release
                                       : std::memory_order_relaxed;
}

constexpr std::memory_order to_memory_order(LoadOrdering o) noexcept {
  return o == LoadOrdering::Acquiring ? std::memory_order_acquire
                                      : std::memory_order_relaxed;
}

/**
 * @brief Store @p value into @p location with @p ordering.
 * @post A subsequent load on the same thread returns @p value.
 */
template <class T>
inline void store(T& location, T value, StoreOrdering ordering) noexcept {
  static_assert(std::is_trivially_copyable_v<T>, "atomic::store requires a trivially copyable T");
  std::atomic_ref<T>(location).store(value, to_memory_order(ordering));
}

/// @brief Load @p location with @p ordering.
template <class T>
inline T load(T& location, LoadOrdering ordering) noexcept {
  static_assert(std::is_trivially_copyable_v<T>, "atomic::load requires a trivially copyable T");
  return std::atomic_ref<T>(location).load(to_memory_order(ordering));
}

/**
 * @class Flag
 * @brief One-shot publication flag: set() releases, is_set() acquires.
 *
 * Typical use: a producer fills a buffer, then set(); a consumer that sees is_set() == true
 * is guaranteed to see the filled buffer.
 */
class Flag {
public:
  explicit Flag(bool initial = false) noexcept : value_(initial ? 1 : 0) {}

  Flag(const Flag&)            = delete;
  Flag& operator=(const Flag&) = delete;

  /// @brief Acquiring read of the flag.
  bool is_set() noexcept;

  /// @brief Releasing write of the flag.
  void set() noexcept;

private:
  alignas(std::atomic_ref<std::uint8_t>::required_alignment) std::uint8_t value_;
};

} // namespace kprim::atomic
