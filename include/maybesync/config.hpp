#ifndef MAYBESYNC_CONFIG_HPP
#define MAYBESYNC_CONFIG_HPP

#include <iosfwd>

// =============================================================================
// Build Mode Selection
// =============================================================================
//
// MAYBESYNC_SYNC picks the primitive family for the whole artifact:
//   1 - multi-thread-safe: real capability markers, std::mutex,
//       std::shared_ptr, std::atomic
//   0 - single-thread: vacuous capability markers, local::exclusive_cell,
//       local::rc, local::cell
//
// MAYBESYNC_ALLOC enables rc, make_rc and box_future (they need a heap).
//
// Both are normally set by CMake as PUBLIC definitions of the maybesync
// target, so every consumer compiles in the mode the library was built in.
// =============================================================================

#ifndef MAYBESYNC_SYNC
#error "maybesync: MAYBESYNC_SYNC is not defined; define it as 0 or 1 (the CMake option MAYBESYNC_SYNC does this for targets linking maybesync)"
#endif

// An empty definition expands to `- - 1`, which is 1.
#if (-MAYBESYNC_SYNC - 1) == 1
#error "maybesync: MAYBESYNC_SYNC is defined but empty; it must be 0 or 1"
#endif

#if MAYBESYNC_SYNC != 0 && MAYBESYNC_SYNC != 1
#error "maybesync: MAYBESYNC_SYNC must be 0 or 1"
#endif

// Identifiers such as ON or OFF evaluate to 0 in #if; only the literals
// 0 and 1 name a defined MAYBESYNC_DETAIL_BIT_ macro.
#define MAYBESYNC_DETAIL_BIT_0 1
#define MAYBESYNC_DETAIL_BIT_1 1
#define MAYBESYNC_DETAIL_CAT_(a, b) a##b
#define MAYBESYNC_DETAIL_CAT(a, b) MAYBESYNC_DETAIL_CAT_(a, b)

#if !MAYBESYNC_DETAIL_CAT(MAYBESYNC_DETAIL_BIT_, MAYBESYNC_SYNC)
#error "maybesync: MAYBESYNC_SYNC must be the literal 0 or 1, not an identifier such as ON or OFF"
#endif

#ifndef MAYBESYNC_ALLOC
#define MAYBESYNC_ALLOC 1
#endif

#if (-MAYBESYNC_ALLOC - 1) == 1
#error "maybesync: MAYBESYNC_ALLOC is defined but empty; it must be 0 or 1"
#endif

#if MAYBESYNC_ALLOC != 0 && MAYBESYNC_ALLOC != 1
#error "maybesync: MAYBESYNC_ALLOC must be 0 or 1"
#endif

#if !MAYBESYNC_DETAIL_CAT(MAYBESYNC_DETAIL_BIT_, MAYBESYNC_ALLOC)
#error "maybesync: MAYBESYNC_ALLOC must be the literal 0 or 1, not an identifier such as ON or OFF"
#endif

// Mode-specific entities live in an inline namespace named after the mode.
// Objects compiled in different modes name different symbols, so mixing
// them is a link error rather than a silent ODR violation.
#if MAYBESYNC_SYNC
#define MAYBESYNC_MODE_NAMESPACE sync
#else
#define MAYBESYNC_MODE_NAMESPACE unsync
#endif

namespace maybesync {

enum class build_mode { sync, unsync };

inline constexpr bool is_sync_build = MAYBESYNC_SYNC != 0;
inline constexpr bool has_alloc = MAYBESYNC_ALLOC != 0;
inline constexpr build_mode mode =
    is_sync_build ? build_mode::sync : build_mode::unsync;

struct build_info {
  build_mode mode;
  bool alloc;
};

const char *to_string(build_mode m) noexcept;

std::ostream &operator<<(std::ostream &os, build_mode m);
std::ostream &operator<<(std::ostream &os, const build_info &info);

inline namespace MAYBESYNC_MODE_NAMESPACE {

// Configuration the compiled library was built with. Only the library built
// for the current mode defines this symbol.
build_info linked_build() noexcept;

} // namespace MAYBESYNC_MODE_NAMESPACE

} // namespace maybesync

#endif // MAYBESYNC_CONFIG_HPP
