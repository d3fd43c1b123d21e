#ifndef MAYBESYNC_LOCAL_EXCLUSIVE_CELL_HPP
#define MAYBESYNC_LOCAL_EXCLUSIVE_CELL_HPP

#include <concepts>
#include <exception>
#include <optional>
#include <utility>

#include "../concepts.hpp"

namespace maybesync::local {

// Thrown when an exclusive_cell is borrowed while a previous borrow is alive.
struct already_borrowed : std::exception {
  const char *what() const noexcept override {
    return "exclusive_cell already borrowed";
  }
};

template <typename T> class exclusive_cell;

// =============================================================================
// Exclusive Borrow Guard
// =============================================================================

template <typename T> class exclusive_ref {
  friend class exclusive_cell<T>;

  T *value_;
  bool *borrowed_;

  exclusive_ref(T *value, bool *borrowed) noexcept
      : value_(value), borrowed_(borrowed) {}

public:
  // The borrow flag is unsynchronized.
  static constexpr bool transferable = false;
  static constexpr bool shareable = false;

  exclusive_ref(const exclusive_ref &) = delete;
  exclusive_ref &operator=(const exclusive_ref &) = delete;

  exclusive_ref(exclusive_ref &&other) noexcept
      : value_(std::exchange(other.value_, nullptr)),
        borrowed_(std::exchange(other.borrowed_, nullptr)) {}

  exclusive_ref &operator=(exclusive_ref &&other) noexcept {
    if (this != &other) {
      release();
      value_ = std::exchange(other.value_, nullptr);
      borrowed_ = std::exchange(other.borrowed_, nullptr);
    }
    return *this;
  }

  ~exclusive_ref() { release(); }

  T &operator*() const noexcept { return *value_; }
  T *operator->() const noexcept { return value_; }

private:
  void release() noexcept {
    if (borrowed_) {
      *borrowed_ = false;
      borrowed_ = nullptr;
      value_ = nullptr;
    }
  }
};

// =============================================================================
// Exclusive Cell - single-thread interior mutability with borrow tracking
// =============================================================================
//
// At most one exclusive_ref exists at a time. A second borrow while the first
// is alive throws already_borrowed (borrow_mut) or yields nothing
// (try_borrow_mut); it never waits.

template <typename T> class exclusive_cell {
  mutable T value_;
  mutable bool borrowed_{false};

public:
  using value_type = T;

  static constexpr bool transferable = Transferable<T>;
  static constexpr bool shareable = false;

  exclusive_cell()
    requires std::default_initializable<T>
      : value_() {}

  explicit exclusive_cell(T value) : value_(std::move(value)) {}

  template <typename... Args>
  explicit exclusive_cell(std::in_place_t, Args &&...args)
      : value_(std::forward<Args>(args)...) {}

  exclusive_cell(const exclusive_cell &) = delete;
  exclusive_cell &operator=(const exclusive_cell &) = delete;

  exclusive_ref<T> borrow_mut() const {
    if (borrowed_)
      throw already_borrowed();
    borrowed_ = true;
    return exclusive_ref<T>(&value_, &borrowed_);
  }

  std::optional<exclusive_ref<T>> try_borrow_mut() const noexcept {
    if (borrowed_)
      return std::nullopt;
    borrowed_ = true;
    return exclusive_ref<T>(&value_, &borrowed_);
  }

  bool is_borrowed() const noexcept { return borrowed_; }

  // Exclusive access to the cell itself rules out live borrows.
  T &get_mut() noexcept { return value_; }

  T into_inner() && { return std::move(value_); }
};

} // namespace maybesync::local

#endif // MAYBESYNC_LOCAL_EXCLUSIVE_CELL_HPP
