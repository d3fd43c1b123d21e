#ifndef MAYBESYNC_MARKERS_HPP
#define MAYBESYNC_MARKERS_HPP

#include "config.hpp"

#if MAYBESYNC_SYNC
#include "sync/markers.hpp"
#else
#include "unsync/markers.hpp"
#endif

namespace maybesync {

template <typename T>
inline constexpr bool is_maybe_transferable_v = MaybeTransferable<T>;

template <typename T>
inline constexpr bool is_maybe_shareable_v = MaybeShareable<T>;

} // namespace maybesync

#endif // MAYBESYNC_MARKERS_HPP
