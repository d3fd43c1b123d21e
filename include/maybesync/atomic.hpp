#ifndef MAYBESYNC_ATOMIC_HPP
#define MAYBESYNC_ATOMIC_HPP

#include "config.hpp"

#if MAYBESYNC_SYNC
#include "sync/atomic.hpp"
#else
#include "unsync/atomic.hpp"
#endif

#endif // MAYBESYNC_ATOMIC_HPP
