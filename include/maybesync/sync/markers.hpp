#ifndef MAYBESYNC_SYNC_MARKERS_HPP
#define MAYBESYNC_SYNC_MARKERS_HPP

#include "../concepts.hpp"
#include "../config.hpp"

#if !MAYBESYNC_SYNC
#error "maybesync/sync headers require MAYBESYNC_SYNC=1"
#endif

namespace maybesync {
inline namespace sync {

// Multi-thread mode: the facade markers are the real guarantees.
//
// A function that always hands its argument to another thread must still be
// written against Transferable / Shareable, so that it stays correct when
// the artifact is built in single-thread mode.
template <typename T>
concept MaybeTransferable = Transferable<T>;

template <typename T>
concept MaybeShareable = Shareable<T>;

} // namespace sync
} // namespace maybesync

#endif // MAYBESYNC_SYNC_MARKERS_HPP
