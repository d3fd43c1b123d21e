#ifndef MAYBESYNC_SYNC_MUTEX_HPP
#define MAYBESYNC_SYNC_MUTEX_HPP

#include <concepts>
#include <mutex>
#include <optional>
#include <utility>

#include "../concepts.hpp"
#include "../config.hpp"
#include "../policies.hpp"

#if !MAYBESYNC_SYNC
#error "maybesync/sync headers require MAYBESYNC_SYNC=1"
#endif

namespace maybesync {
inline namespace sync {

// =============================================================================
// Mutex Guard - scoped exclusive access, releases on destruction
// =============================================================================

template <typename T, typename LockType> class mutex_guard {
  LockType lock_;
  T *value_;

public:
  // Must be released by the thread that acquired it.
  static constexpr bool transferable = false;
  static constexpr bool shareable = Shareable<T>;

  mutex_guard(LockType lock, T *value) noexcept
      : lock_(std::move(lock)), value_(value) {}

  mutex_guard(mutex_guard &&) noexcept = default;
  mutex_guard &operator=(mutex_guard &&) noexcept = default;

  mutex_guard(const mutex_guard &) = delete;
  mutex_guard &operator=(const mutex_guard &) = delete;

  T &operator*() const noexcept { return *value_; }
  T *operator->() const noexcept { return value_; }
};

// =============================================================================
// Basic Mutex - value guarded by a blocking lock
// =============================================================================
//
// lock() on a mutex the calling thread already holds deadlocks. This is the
// backing lock's behaviour and is not detected; the single-thread backend
// throws local::already_borrowed in the same situation instead.

template <typename T, typename Policy = mutex_lock_policy>
  requires LockPolicy<Policy>
class basic_mutex {
  using mutex_type = typename Policy::mutex_type;
  using lock_type = typename Policy::lock_type;

public:
  using value_type = T;
  using guard = mutex_guard<T, lock_type>;

  // Only one thread reaches the payload at a time, so moving it between
  // threads is all that is required.
  static constexpr bool transferable = Transferable<T>;
  static constexpr bool shareable = Transferable<T>;

  basic_mutex()
    requires std::default_initializable<T>
      : value_() {}

  explicit basic_mutex(T value) : value_(std::move(value)) {}

  template <typename... Args>
  explicit basic_mutex(std::in_place_t, Args &&...args)
      : value_(std::forward<Args>(args)...) {}

  basic_mutex(const basic_mutex &) = delete;
  basic_mutex &operator=(const basic_mutex &) = delete;

  // Blocks until the lock is free.
  guard lock() const {
    lock_type lock(mutex_);
    return guard(std::move(lock), &value_);
  }

  // Never blocks; empty if another thread holds a guard. With the default
  // policy, calling this while the calling thread holds a guard is undefined
  // (std::mutex::try_lock precondition); spinlock_policy reports it as empty.
  std::optional<guard> try_lock() const {
    lock_type lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock())
      return std::nullopt;
    return guard(std::move(lock), &value_);
  }

  // No locking: exclusive access to the mutex itself rules out other users.
  T &get_mut() noexcept { return value_; }

  T into_inner() && { return std::move(value_); }

private:
  mutable mutex_type mutex_;
  mutable T value_;
};

template <typename T> using mutex = basic_mutex<T>;

} // namespace sync
} // namespace maybesync

#endif // MAYBESYNC_SYNC_MUTEX_HPP
