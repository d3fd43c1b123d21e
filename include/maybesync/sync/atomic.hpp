#ifndef MAYBESYNC_SYNC_ATOMIC_HPP
#define MAYBESYNC_SYNC_ATOMIC_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "../config.hpp"

#if !MAYBESYNC_SYNC
#error "maybesync/sync headers require MAYBESYNC_SYNC=1"
#endif

namespace maybesync {
inline namespace sync {

// Lock-free where the platform allows, sequentially consistent unless an
// order is passed.
using atomic_bool = std::atomic<bool>;
using atomic_i8 = std::atomic<std::int8_t>;
using atomic_i16 = std::atomic<std::int16_t>;
using atomic_i32 = std::atomic<std::int32_t>;
using atomic_isize = std::atomic<std::ptrdiff_t>;
using atomic_u8 = std::atomic<std::uint8_t>;
using atomic_u16 = std::atomic<std::uint16_t>;
using atomic_u32 = std::atomic<std::uint32_t>;
using atomic_usize = std::atomic<std::size_t>;

template <typename T> using atomic_ptr = std::atomic<T *>;

} // namespace sync
} // namespace maybesync

#endif // MAYBESYNC_SYNC_ATOMIC_HPP
