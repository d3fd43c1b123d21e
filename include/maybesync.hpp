#ifndef MAYBESYNC_HPP
#define MAYBESYNC_HPP

// =============================================================================
// maybesync
// =============================================================================
//
// One source, two builds. Libraries that may run either on many threads or
// on exactly one (a browser, a single-threaded event loop) write their bounds
// and primitives once against this vocabulary; MAYBESYNC_SYNC decides what
// they mean for the whole artifact.
//
//                       MAYBESYNC_SYNC=1             MAYBESYNC_SYNC=0
//   MaybeTransferable   Transferable                 every type
//   MaybeShareable      Shareable                    every type
//   mutex<T>            std::mutex + T               local::exclusive_cell<T>
//   rc<T>               std::shared_ptr<T>           local::rc<T>
//   atomic_i32 ...      std::atomic<std::int32_t>    local::cell<std::int32_t>
//   box_future<T>       transferable dyn<deferred>   dyn<deferred>
//   MAYBESYNC_DYN_*     dyn<I, markers...>           dyn<I>
//
// rc, make_rc and box_future need MAYBESYNC_ALLOC=1.
//
// Code that unconditionally hands a value to another thread must require
// Transferable / Shareable itself. The Maybe* markers are vacuous in
// single-thread builds and prove nothing there.
//
// =============================================================================

// Foundation headers
#include "maybesync/config.hpp"
#include "maybesync/concepts.hpp"
#include "maybesync/policies.hpp"

// Facade headers
#include "maybesync/atomic.hpp"
#include "maybesync/dyn.hpp"
#include "maybesync/markers.hpp"
#include "maybesync/mutex.hpp"

#if MAYBESYNC_ALLOC
#include "maybesync/box_future.hpp"
#include "maybesync/rc.hpp"
#endif

#endif // MAYBESYNC_HPP
