#ifndef MAYBESYNC_RC_HPP
#define MAYBESYNC_RC_HPP

#include "config.hpp"

#if MAYBESYNC_SYNC
#include "sync/rc.hpp"
#else
#include "unsync/rc.hpp"
#endif

#endif // MAYBESYNC_RC_HPP
