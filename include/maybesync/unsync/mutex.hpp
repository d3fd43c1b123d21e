#ifndef MAYBESYNC_UNSYNC_MUTEX_HPP
#define MAYBESYNC_UNSYNC_MUTEX_HPP

#include <concepts>
#include <optional>
#include <utility>

#include "../concepts.hpp"
#include "../config.hpp"
#include "../local/exclusive_cell.hpp"

#if MAYBESYNC_SYNC
#error "maybesync/unsync headers require MAYBESYNC_SYNC=0"
#endif

namespace maybesync {
inline namespace unsync {

// =============================================================================
// Mutex - same surface as the multi-thread mutex over an exclusive_cell
// =============================================================================
//
// There is no second thread to wait for, so lock() never blocks. Locking
// again while a guard is alive throws local::already_borrowed, where the
// multi-thread backend would deadlock.

template <typename T> class mutex {
  local::exclusive_cell<T> cell_;

public:
  using value_type = T;
  using guard = local::exclusive_ref<T>;

  static constexpr bool transferable = Transferable<T>;
  static constexpr bool shareable = false;

  mutex()
    requires std::default_initializable<T>
  = default;

  explicit mutex(T value) : cell_(std::move(value)) {}

  template <typename... Args>
  explicit mutex(std::in_place_t, Args &&...args)
      : cell_(std::in_place, std::forward<Args>(args)...) {}

  mutex(const mutex &) = delete;
  mutex &operator=(const mutex &) = delete;

  // Throws local::already_borrowed if a guard is alive.
  guard lock() const { return cell_.borrow_mut(); }

  std::optional<guard> try_lock() const noexcept {
    return cell_.try_borrow_mut();
  }

  T &get_mut() noexcept { return cell_.get_mut(); }

  T into_inner() && { return std::move(cell_).into_inner(); }
};

} // namespace unsync
} // namespace maybesync

#endif // MAYBESYNC_UNSYNC_MUTEX_HPP
