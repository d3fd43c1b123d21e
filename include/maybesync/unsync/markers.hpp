#ifndef MAYBESYNC_UNSYNC_MARKERS_HPP
#define MAYBESYNC_UNSYNC_MARKERS_HPP

#include "../concepts.hpp"
#include "../config.hpp"

#if MAYBESYNC_SYNC
#error "maybesync/unsync headers require MAYBESYNC_SYNC=0"
#endif

namespace maybesync {
inline namespace unsync {

// Single-thread mode: nothing ever reaches a second thread, so every type
// satisfies both markers. They grant no actual safety; code that does cross
// a thread boundary must use Transferable / Shareable directly.
template <typename T>
concept MaybeTransferable = true;

template <typename T>
concept MaybeShareable = true;

} // namespace unsync
} // namespace maybesync

#endif // MAYBESYNC_UNSYNC_MARKERS_HPP
