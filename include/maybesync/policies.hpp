#ifndef MAYBESYNC_POLICIES_HPP
#define MAYBESYNC_POLICIES_HPP

#include <atomic>
#include <mutex>

namespace maybesync {

// =============================================================================
// Lock Policies (multi-thread mode backends)
// =============================================================================

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
        // Spin with relaxed ordering for cache efficiency
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

// For short critical sections under low contention.
struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

} // namespace maybesync

#endif // MAYBESYNC_POLICIES_HPP
