#ifndef MAYBESYNC_CONCEPTS_HPP
#define MAYBESYNC_CONCEPTS_HPP

#include <array>
#include <atomic>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace maybesync {

// =============================================================================
// Real Cross-Thread Guarantees
// =============================================================================
//
// is_transferable<T>: a value of T may be handed over to another thread.
// is_shareable<T>:    a const T& may be used from several threads at once.
//
// These hold in both build modes. Resolution order:
//   1. explicit specialization (see MAYBESYNC_DECLARE_* below)
//   2. static member marker:  static constexpr bool transferable = ...;
//                             static constexpr bool shareable = ...;
//   3. the rules below for fundamental and standard library types
//   4. default: object types other than object pointers are both
//
// C++ cannot see what a class or closure holds, so a type with thread-bound
// state must opt out through 1 or 2.
// =============================================================================

template <typename T> struct is_transferable;
template <typename T> struct is_shareable;

namespace detail {

template <typename T, typename = void>
struct has_transferable_marker : std::false_type {};

template <typename T>
struct has_transferable_marker<T, std::void_t<decltype(T::transferable)>>
    : std::true_type {};

template <typename T, typename = void>
struct has_shareable_marker : std::false_type {};

template <typename T>
struct has_shareable_marker<T, std::void_t<decltype(T::shareable)>>
    : std::true_type {};

// Function pointers carry no state; object pointers alias unknown state.
template <typename T>
inline constexpr bool plain_object_v =
    std::is_object_v<T> &&
    (!std::is_pointer_v<T> || std::is_function_v<std::remove_pointer_t<T>>);

template <typename T> constexpr bool default_transferable() {
  if constexpr (has_transferable_marker<T>::value) {
    return static_cast<bool>(T::transferable);
  } else {
    return plain_object_v<T>;
  }
}

template <typename T> constexpr bool default_shareable() {
  if constexpr (has_shareable_marker<T>::value) {
    return static_cast<bool>(T::shareable);
  } else {
    return plain_object_v<T>;
  }
}

} // namespace detail

template <typename T>
struct is_transferable
    : std::bool_constant<detail::default_transferable<T>()> {};

template <typename T>
struct is_shareable : std::bool_constant<detail::default_shareable<T>()> {};

template <typename T>
inline constexpr bool is_transferable_v =
    is_transferable<std::remove_cv_t<T>>::value;

template <typename T>
inline constexpr bool is_shareable_v = is_shareable<std::remove_cv_t<T>>::value;

// =============================================================================
// Core Type Concepts
// =============================================================================

template <typename T>
concept Transferable = is_transferable_v<T>;

template <typename T>
concept Shareable = is_shareable_v<T>;

template <typename T>
concept ThreadSafe = Transferable<T> && Shareable<T>;

// =============================================================================
// References and Arrays
// =============================================================================

// A mutable reference carries the value with it.
template <typename T> struct is_transferable<T &> : is_transferable<T> {};

// Handing out a const reference means sharing the referent.
template <typename T>
struct is_transferable<const T &> : std::bool_constant<Shareable<T>> {};

template <typename T> struct is_transferable<T &&> : is_transferable<T> {};

template <typename T> struct is_shareable<T &> : std::false_type {};

template <typename T>
struct is_shareable<const T &> : std::bool_constant<Shareable<T>> {};

template <typename T> struct is_shareable<T &&> : std::false_type {};

template <typename T, std::size_t N>
struct is_transferable<T[N]> : std::bool_constant<Transferable<T>> {};

template <typename T, std::size_t N>
struct is_shareable<T[N]> : std::bool_constant<Shareable<T>> {};

// =============================================================================
// Standard Library Synchronization Types
// =============================================================================

template <typename T> struct is_transferable<std::atomic<T>> : std::true_type {};
template <typename T> struct is_shareable<std::atomic<T>> : std::true_type {};

template <> struct is_transferable<std::atomic_flag> : std::true_type {};
template <> struct is_shareable<std::atomic_flag> : std::true_type {};

template <> struct is_transferable<std::mutex> : std::true_type {};
template <> struct is_shareable<std::mutex> : std::true_type {};

template <> struct is_transferable<std::recursive_mutex> : std::true_type {};
template <> struct is_shareable<std::recursive_mutex> : std::true_type {};

template <> struct is_transferable<std::shared_mutex> : std::true_type {};
template <> struct is_shareable<std::shared_mutex> : std::true_type {};

// =============================================================================
// Standard Library Owners and Containers
// =============================================================================

// The count is atomic, but every clone hands out the same payload.
template <typename T>
struct is_transferable<std::shared_ptr<T>> : std::bool_constant<ThreadSafe<T>> {};
template <typename T>
struct is_shareable<std::shared_ptr<T>> : std::bool_constant<ThreadSafe<T>> {};

template <typename T>
struct is_transferable<std::weak_ptr<T>> : std::bool_constant<ThreadSafe<T>> {};
template <typename T>
struct is_shareable<std::weak_ptr<T>> : std::bool_constant<ThreadSafe<T>> {};

template <typename T, typename D>
struct is_transferable<std::unique_ptr<T, D>>
    : std::bool_constant<Transferable<T> && Transferable<D>> {};
template <typename T, typename D>
struct is_shareable<std::unique_ptr<T, D>>
    : std::bool_constant<Shareable<T> && Shareable<D>> {};

template <typename T>
struct is_transferable<std::optional<T>> : std::bool_constant<Transferable<T>> {};
template <typename T>
struct is_shareable<std::optional<T>> : std::bool_constant<Shareable<T>> {};

template <typename T, typename A>
struct is_transferable<std::vector<T, A>> : std::bool_constant<Transferable<T>> {};
template <typename T, typename A>
struct is_shareable<std::vector<T, A>> : std::bool_constant<Shareable<T>> {};

template <typename T, std::size_t N>
struct is_transferable<std::array<T, N>> : std::bool_constant<Transferable<T>> {};
template <typename T, std::size_t N>
struct is_shareable<std::array<T, N>> : std::bool_constant<Shareable<T>> {};

template <typename A, typename B>
struct is_transferable<std::pair<A, B>>
    : std::bool_constant<Transferable<A> && Transferable<B>> {};
template <typename A, typename B>
struct is_shareable<std::pair<A, B>>
    : std::bool_constant<Shareable<A> && Shareable<B>> {};

template <typename... Ts>
struct is_transferable<std::tuple<Ts...>>
    : std::bool_constant<(Transferable<Ts> && ...)> {};
template <typename... Ts>
struct is_shareable<std::tuple<Ts...>>
    : std::bool_constant<(Shareable<Ts> && ...)> {};

// The target is erased, nothing is known about it.
template <typename Sig>
struct is_transferable<std::function<Sig>> : std::false_type {};
template <typename Sig>
struct is_shareable<std::function<Sig>> : std::false_type {};

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

template <typename P>
concept LockPolicy = Lockable<typename P::mutex_type> && requires {
  typename P::lock_type;
};

} // namespace maybesync

// =============================================================================
// Opt-in / Opt-out for Third-Party Types
// =============================================================================
//
// Use at global scope:
//   MAYBESYNC_DECLARE_TRANSFERABLE(legacy_handle, false);
//   MAYBESYNC_DECLARE_SHAREABLE(legacy_handle, false);

#define MAYBESYNC_DECLARE_TRANSFERABLE(Type, Value)                            \
  template <>                                                                  \
  struct maybesync::is_transferable<Type> : std::bool_constant<(Value)> {}

#define MAYBESYNC_DECLARE_SHAREABLE(Type, Value)                               \
  template <>                                                                  \
  struct maybesync::is_shareable<Type> : std::bool_constant<(Value)> {}

#endif // MAYBESYNC_CONCEPTS_HPP
