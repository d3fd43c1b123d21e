#ifndef MAYBESYNC_UNSYNC_ATOMIC_HPP
#define MAYBESYNC_UNSYNC_ATOMIC_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "../config.hpp"
#include "../local/cell.hpp"

#if MAYBESYNC_SYNC
#error "maybesync/unsync headers require MAYBESYNC_SYNC=0"
#endif

namespace maybesync {
inline namespace unsync {

// Plain reads and writes behind the std::atomic member names.
using atomic_bool = local::cell<bool>;
using atomic_i8 = local::cell<std::int8_t>;
using atomic_i16 = local::cell<std::int16_t>;
using atomic_i32 = local::cell<std::int32_t>;
using atomic_isize = local::cell<std::ptrdiff_t>;
using atomic_u8 = local::cell<std::uint8_t>;
using atomic_u16 = local::cell<std::uint16_t>;
using atomic_u32 = local::cell<std::uint32_t>;
using atomic_usize = local::cell<std::size_t>;

template <typename T> using atomic_ptr = local::cell<T *>;

// Structures embedding these keep their size and alignment across modes.
static_assert(local::same_layout_as_atomic<bool>);
static_assert(local::same_layout_as_atomic<std::int8_t>);
static_assert(local::same_layout_as_atomic<std::int16_t>);
static_assert(local::same_layout_as_atomic<std::int32_t>);
static_assert(local::same_layout_as_atomic<std::ptrdiff_t>);
static_assert(local::same_layout_as_atomic<std::uint8_t>);
static_assert(local::same_layout_as_atomic<std::uint16_t>);
static_assert(local::same_layout_as_atomic<std::uint32_t>);
static_assert(local::same_layout_as_atomic<std::size_t>);
static_assert(local::same_layout_as_atomic<void *>);

} // namespace unsync
} // namespace maybesync

#endif // MAYBESYNC_UNSYNC_ATOMIC_HPP
