#ifndef MAYBESYNC_SYNC_RC_HPP
#define MAYBESYNC_SYNC_RC_HPP

#include <memory>
#include <utility>

#include "../config.hpp"
#include "../heap.hpp"

#if !MAYBESYNC_SYNC
#error "maybesync/sync headers require MAYBESYNC_SYNC=1"
#endif

namespace maybesync {
inline namespace sync {

// Atomic reference count: handles to one payload may be copied and dropped
// from any thread.
template <typename T> using rc = std::shared_ptr<T>;

template <typename T, typename... Args> rc<T> make_rc(Args &&...args) {
  return std::allocate_shared<T>(heap_allocator<T>(),
                                 std::forward<Args>(args)...);
}

} // namespace sync
} // namespace maybesync

#endif // MAYBESYNC_SYNC_RC_HPP
