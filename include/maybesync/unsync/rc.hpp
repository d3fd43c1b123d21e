#ifndef MAYBESYNC_UNSYNC_RC_HPP
#define MAYBESYNC_UNSYNC_RC_HPP

#include <utility>

#include "../config.hpp"
#include "../local/rc.hpp"

#if MAYBESYNC_SYNC
#error "maybesync/unsync headers require MAYBESYNC_SYNC=0"
#endif

namespace maybesync {
inline namespace unsync {

// Plain reference count: every handle to a payload stays on one thread.
template <typename T> using rc = local::rc<T>;

template <typename T, typename... Args> rc<T> make_rc(Args &&...args) {
  return local::make_rc<T>(std::forward<Args>(args)...);
}

} // namespace unsync
} // namespace maybesync

#endif // MAYBESYNC_UNSYNC_RC_HPP
