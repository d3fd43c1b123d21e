#ifndef MAYBESYNC_LOCAL_CELL_HPP
#define MAYBESYNC_LOCAL_CELL_HPP

#include <atomic>
#include <concepts>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace maybesync::local {

namespace detail {

// Two's complement wrap-around, as std::atomic does for signed types.
template <typename T> constexpr T wrapping_add(T a, T b) noexcept {
  using U = std::make_unsigned_t<T>;
  return static_cast<T>(static_cast<U>(static_cast<U>(a) + static_cast<U>(b)));
}

template <typename T> constexpr T wrapping_sub(T a, T b) noexcept {
  using U = std::make_unsigned_t<T>;
  return static_cast<T>(static_cast<U>(static_cast<U>(a) - static_cast<U>(b)));
}

template <typename T>
concept cell_integral = std::integral<T> && !std::same_as<T, bool>;

} // namespace detail

// =============================================================================
// Cell - non-atomic stand-in for std::atomic<T>
// =============================================================================
//
// Same member names, same layout as std::atomic<T>. Memory order arguments
// are accepted and ignored: there is only one thread to order against.

template <typename T> class cell {
  static_assert(std::is_trivially_copyable_v<T>,
                "cell<T> requires a trivially copyable T");

  alignas(std::atomic<T>) T value_;

public:
  using value_type = T;

  static constexpr bool transferable = true;
  static constexpr bool shareable = false;
  static constexpr bool is_always_lock_free = true;

  constexpr cell() noexcept : value_() {}
  constexpr cell(T desired) noexcept : value_(desired) {}

  cell(const cell &) = delete;
  cell &operator=(const cell &) = delete;

  bool is_lock_free() const noexcept { return true; }

  T load(std::memory_order = std::memory_order_seq_cst) const noexcept {
    return value_;
  }

  void store(T desired,
             std::memory_order = std::memory_order_seq_cst) noexcept {
    value_ = desired;
  }

  operator T() const noexcept { return value_; }

  T operator=(T desired) noexcept {
    value_ = desired;
    return desired;
  }

  T exchange(T desired,
             std::memory_order = std::memory_order_seq_cst) noexcept {
    return std::exchange(value_, desired);
  }

  bool compare_exchange_strong(T &expected, T desired, std::memory_order,
                               std::memory_order) noexcept {
    return compare_exchange_strong(expected, desired);
  }

  bool compare_exchange_strong(
      T &expected, T desired,
      std::memory_order = std::memory_order_seq_cst) noexcept {
    if (value_ == expected) {
      value_ = desired;
      return true;
    }
    expected = value_;
    return false;
  }

  // Never fails spuriously.
  bool compare_exchange_weak(T &expected, T desired, std::memory_order,
                             std::memory_order) noexcept {
    return compare_exchange_strong(expected, desired);
  }

  bool compare_exchange_weak(
      T &expected, T desired,
      std::memory_order = std::memory_order_seq_cst) noexcept {
    return compare_exchange_strong(expected, desired);
  }

  // ---------------------------------------------------------------------------
  // Integral operations
  // ---------------------------------------------------------------------------

  T fetch_add(T arg, std::memory_order = std::memory_order_seq_cst) noexcept
    requires detail::cell_integral<T>
  {
    return std::exchange(value_, detail::wrapping_add(value_, arg));
  }

  T fetch_sub(T arg, std::memory_order = std::memory_order_seq_cst) noexcept
    requires detail::cell_integral<T>
  {
    return std::exchange(value_, detail::wrapping_sub(value_, arg));
  }

  T fetch_and(T arg, std::memory_order = std::memory_order_seq_cst) noexcept
    requires detail::cell_integral<T>
  {
    return std::exchange(value_, static_cast<T>(value_ & arg));
  }

  T fetch_or(T arg, std::memory_order = std::memory_order_seq_cst) noexcept
    requires detail::cell_integral<T>
  {
    return std::exchange(value_, static_cast<T>(value_ | arg));
  }

  T fetch_xor(T arg, std::memory_order = std::memory_order_seq_cst) noexcept
    requires detail::cell_integral<T>
  {
    return std::exchange(value_, static_cast<T>(value_ ^ arg));
  }

  T operator+=(T arg) noexcept
    requires detail::cell_integral<T>
  {
    return value_ = detail::wrapping_add(value_, arg);
  }

  T operator-=(T arg) noexcept
    requires detail::cell_integral<T>
  {
    return value_ = detail::wrapping_sub(value_, arg);
  }

  T operator&=(T arg) noexcept
    requires detail::cell_integral<T>
  {
    return value_ = static_cast<T>(value_ & arg);
  }

  T operator|=(T arg) noexcept
    requires detail::cell_integral<T>
  {
    return value_ = static_cast<T>(value_ | arg);
  }

  T operator^=(T arg) noexcept
    requires detail::cell_integral<T>
  {
    return value_ = static_cast<T>(value_ ^ arg);
  }

  T operator++() noexcept
    requires detail::cell_integral<T>
  {
    return *this += T(1);
  }

  T operator++(int) noexcept
    requires detail::cell_integral<T>
  {
    return fetch_add(T(1));
  }

  T operator--() noexcept
    requires detail::cell_integral<T>
  {
    return *this -= T(1);
  }

  T operator--(int) noexcept
    requires detail::cell_integral<T>
  {
    return fetch_sub(T(1));
  }

  // ---------------------------------------------------------------------------
  // Pointer arithmetic
  // ---------------------------------------------------------------------------

  T fetch_add(std::ptrdiff_t arg,
              std::memory_order = std::memory_order_seq_cst) noexcept
    requires std::is_pointer_v<T>
  {
    return std::exchange(value_, value_ + arg);
  }

  T fetch_sub(std::ptrdiff_t arg,
              std::memory_order = std::memory_order_seq_cst) noexcept
    requires std::is_pointer_v<T>
  {
    return std::exchange(value_, value_ - arg);
  }

  T operator+=(std::ptrdiff_t arg) noexcept
    requires std::is_pointer_v<T>
  {
    return value_ += arg;
  }

  T operator-=(std::ptrdiff_t arg) noexcept
    requires std::is_pointer_v<T>
  {
    return value_ -= arg;
  }

  T operator++() noexcept
    requires std::is_pointer_v<T>
  {
    return ++value_;
  }

  T operator++(int) noexcept
    requires std::is_pointer_v<T>
  {
    return value_++;
  }

  T operator--() noexcept
    requires std::is_pointer_v<T>
  {
    return --value_;
  }

  T operator--(int) noexcept
    requires std::is_pointer_v<T>
  {
    return value_--;
  }
};

template <typename T>
inline constexpr bool same_layout_as_atomic =
    sizeof(cell<T>) == sizeof(std::atomic<T>) &&
    alignof(cell<T>) == alignof(std::atomic<T>);

} // namespace maybesync::local

#endif // MAYBESYNC_LOCAL_CELL_HPP
