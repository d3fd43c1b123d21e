#ifndef MAYBESYNC_BOX_FUTURE_HPP
#define MAYBESYNC_BOX_FUTURE_HPP

#include <concepts>
#include <functional>
#include <future>
#include <type_traits>
#include <utility>

#include "concepts.hpp"
#include "config.hpp"
#include "dyn.hpp"

#if !MAYBESYNC_ALLOC
#error "maybesync/box_future.hpp requires MAYBESYNC_ALLOC=1"
#endif

namespace maybesync {

// =============================================================================
// Deferred Computation Interface
// =============================================================================

template <typename T> class deferred {
public:
  using result_type = T;

  virtual ~deferred() = default;

  // Runs the computation to completion. Called at most once.
  virtual T run() = 0;
};

template <typename T, typename F> class deferred_fn final : public deferred<T> {
  F fn_;

public:
  // Whatever the callable may do, the wrapper may do.
  static constexpr bool transferable = Transferable<F>;
  static constexpr bool shareable = Shareable<F>;

  template <typename G>
  explicit deferred_fn(G &&fn) : fn_(std::forward<G>(fn)) {}

  T run() override { return std::invoke(std::move(fn_)); }
};

// =============================================================================
// Box Future - owned, type-erased, one-shot deferred computation
// =============================================================================

template <typename Dyn> class basic_box_future;

template <typename T, CapabilityMarker... Markers>
class basic_box_future<dyn<deferred<T>, Markers...>> {
  using body_type = dyn<deferred<T>, Markers...>;

  body_type body_;

public:
  using result_type = T;

  static constexpr bool transferable = body_type::transferable;
  static constexpr bool shareable = body_type::shareable;

  basic_box_future() noexcept = default;

  template <typename F>
    requires(!std::same_as<std::remove_cvref_t<F>, basic_box_future>) &&
            std::invocable<std::decay_t<F>> &&
            std::convertible_to<std::invoke_result_t<std::decay_t<F>>, T> &&
            body_type::template admits<deferred_fn<T, std::decay_t<F>>>
  basic_box_future(F &&fn)
      : body_(body_type::template make<deferred_fn<T, std::decay_t<F>>>(
            std::forward<F>(fn))) {}

  explicit basic_box_future(body_type body) noexcept
      : body_(std::move(body)) {}

  basic_box_future(basic_box_future &&) noexcept = default;
  basic_box_future &operator=(basic_box_future &&) noexcept = default;

  bool valid() const noexcept { return static_cast<bool>(body_); }

  // Drives the computation on the calling thread and empties the handle.
  T get() {
    if (!body_)
      throw std::future_error(std::future_errc::no_state);
    body_type body = std::move(body_);
    return body->run();
  }
};

// Sendable to a worker pool in multi-thread mode, thread-bound otherwise.
template <typename T>
using box_future = basic_box_future<MAYBESYNC_DYN_TRANSFERABLE(deferred<T>)>;

} // namespace maybesync

#endif // MAYBESYNC_BOX_FUTURE_HPP
