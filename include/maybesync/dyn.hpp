#ifndef MAYBESYNC_DYN_HPP
#define MAYBESYNC_DYN_HPP

#include <concepts>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

#include "concepts.hpp"
#include "config.hpp"

namespace maybesync {

// =============================================================================
// Capability Markers for Trait-Object Bounds
// =============================================================================
//
// A marker admits an implementation type iff the real guarantee holds for
// it. Markers name real guarantees in both modes; the MAYBESYNC_DYN_* macros
// decide per mode whether a marker is attached at all.

struct transferable_marker {
  template <typename T> static constexpr bool admits = Transferable<T>;
};

struct shareable_marker {
  template <typename T> static constexpr bool admits = Shareable<T>;
};

template <typename M> struct is_capability_marker : std::false_type {};
template <> struct is_capability_marker<transferable_marker> : std::true_type {};
template <> struct is_capability_marker<shareable_marker> : std::true_type {};

template <typename M>
concept CapabilityMarker = is_capability_marker<M>::value;

namespace detail {

template <typename M, typename... Ms>
inline constexpr bool contains_marker = (std::same_as<M, Ms> || ...);

} // namespace detail

// =============================================================================
// dyn - owning handle to an Interface implementation with capability bounds
// =============================================================================
//
// dyn<I, Markers...> holds any object deriving from I that every marker
// admits. Rejection happens at compile time: an implementation that fails a
// bound does not convert.

template <typename Interface, CapabilityMarker... Markers> class dyn {
  static_assert(std::is_class_v<Interface>,
                "dyn<Interface, ...>: Interface must be a class type");
  static_assert(std::has_virtual_destructor_v<Interface>,
                "dyn<Interface, ...>: Interface needs a virtual destructor");

  template <typename I, CapabilityMarker... Ms> friend class dyn;

  std::unique_ptr<Interface> ptr_;

public:
  using interface_type = Interface;

  static constexpr bool transferable =
      detail::contains_marker<transferable_marker, Markers...>;
  static constexpr bool shareable =
      detail::contains_marker<shareable_marker, Markers...>;

  template <typename Impl>
  static constexpr bool admits = std::derived_from<Impl, Interface> &&
                                 (Markers::template admits<Impl> && ...);

  dyn() noexcept = default;
  dyn(std::nullptr_t) noexcept {}

  template <typename Impl>
    requires admits<Impl>
  dyn(std::unique_ptr<Impl> impl) noexcept : ptr_(std::move(impl)) {}

  // Drops capabilities: a value bounded by more markers converts to a
  // bound with a subset of them.
  template <CapabilityMarker... Others>
    requires(!std::same_as<dyn<Interface, Others...>, dyn> &&
             (detail::contains_marker<Markers, Others...> && ...))
  dyn(dyn<Interface, Others...> &&other) noexcept
      : ptr_(std::move(other.ptr_)) {}

  dyn(dyn &&) noexcept = default;
  dyn &operator=(dyn &&) noexcept = default;

  dyn(const dyn &) = delete;
  dyn &operator=(const dyn &) = delete;

  template <typename Impl, typename... Args>
    requires admits<Impl> && std::constructible_from<Impl, Args...>
  static dyn make(Args &&...args) {
    return dyn(std::make_unique<Impl>(std::forward<Args>(args)...));
  }

  Interface *get() const noexcept { return ptr_.get(); }
  Interface &operator*() const noexcept { return *ptr_; }
  Interface *operator->() const noexcept { return ptr_.get(); }

  explicit operator bool() const noexcept { return static_cast<bool>(ptr_); }

  void reset() noexcept { ptr_.reset(); }

  std::unique_ptr<Interface> into_unique() && noexcept {
    return std::move(ptr_);
  }
};

} // namespace maybesync

// =============================================================================
// Trait-Object Bound Macros
// =============================================================================
//
// One call site, one spelling; the expansion depends on MAYBESYNC_SYNC.
//
//   using task_ptr = MAYBESYNC_DYN_TRANSFERABLE(task);
//
//   sync:   ::maybesync::dyn<task, ::maybesync::transferable_marker>
//   unsync: ::maybesync::dyn<task>

#define MAYBESYNC_DYN(...) ::maybesync::dyn<__VA_ARGS__>

#if MAYBESYNC_SYNC

#define MAYBESYNC_DYN_TRANSFERABLE(...)                                        \
  MAYBESYNC_DYN(__VA_ARGS__, ::maybesync::transferable_marker)

#define MAYBESYNC_DYN_SHAREABLE(...)                                           \
  MAYBESYNC_DYN(__VA_ARGS__, ::maybesync::shareable_marker)

#define MAYBESYNC_DYN_TRANSFERABLE_SHAREABLE(...)                              \
  MAYBESYNC_DYN(__VA_ARGS__, ::maybesync::transferable_marker,                 \
                ::maybesync::shareable_marker)

#else

#define MAYBESYNC_DYN_TRANSFERABLE(...) MAYBESYNC_DYN(__VA_ARGS__)

#define MAYBESYNC_DYN_SHAREABLE(...) MAYBESYNC_DYN(__VA_ARGS__)

#define MAYBESYNC_DYN_TRANSFERABLE_SHAREABLE(...) MAYBESYNC_DYN(__VA_ARGS__)

#endif

#endif // MAYBESYNC_DYN_HPP
