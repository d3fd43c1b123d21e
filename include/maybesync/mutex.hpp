#ifndef MAYBESYNC_MUTEX_HPP
#define MAYBESYNC_MUTEX_HPP

#include "config.hpp"

#if MAYBESYNC_SYNC
#include "sync/mutex.hpp"
#else
#include "unsync/mutex.hpp"
#endif

#endif // MAYBESYNC_MUTEX_HPP
