#ifndef MAYBESYNC_LOCAL_RC_HPP
#define MAYBESYNC_LOCAL_RC_HPP

#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>

#include "../heap.hpp"

namespace maybesync::local {

template <typename T> class rc;

template <typename T, typename... Args> rc<T> make_rc(Args &&...args);

namespace detail {

// Shared by every handle to one payload, whatever static type the handle
// names. destroy tears down the payload and frees the whole block.
struct rc_header {
  std::size_t count;
  void (*destroy)(rc_header *) noexcept;

  explicit rc_header(void (*d)(rc_header *) noexcept) noexcept
      : count(1), destroy(d) {}
};

template <typename T> struct rc_block final : rc_header {
  T value;

  template <typename... Args>
  explicit rc_block(Args &&...args)
      : rc_header(&rc_block::release_block),
        value(std::forward<Args>(args)...) {}

  static void release_block(rc_header *header) noexcept {
    using block_allocator = heap_allocator<rc_block>;
    using block_traits = std::allocator_traits<block_allocator>;

    auto *block = static_cast<rc_block *>(header);
    block_allocator alloc;
    block_traits::destroy(alloc, block);
    block_traits::deallocate(alloc, block, 1);
  }
};

} // namespace detail

// =============================================================================
// Rc - shared ownership with a plain (non-atomic) count
// =============================================================================
//
// The std::shared_ptr subset that both modes agree on, including conversion
// from rc<Derived> to rc<Base>. Count and payload share one heap block.
// Copying or destroying handles to the same payload from two threads at once
// is undefined.

template <typename T> class rc {
  template <typename U> friend class rc;
  template <typename U, typename... Args> friend rc<U> make_rc(Args &&...args);

  detail::rc_header *header_{nullptr};
  T *ptr_{nullptr};

  rc(detail::rc_header *header, T *ptr) noexcept
      : header_(header), ptr_(ptr) {}

  void release() noexcept {
    if (header_ && --header_->count == 0)
      header_->destroy(header_);
    header_ = nullptr;
    ptr_ = nullptr;
  }

public:
  using element_type = T;

  // Non-atomic count: bound to the creating thread.
  static constexpr bool transferable = false;
  static constexpr bool shareable = false;

  constexpr rc() noexcept = default;
  constexpr rc(std::nullptr_t) noexcept {}

  rc(const rc &other) noexcept : header_(other.header_), ptr_(other.ptr_) {
    if (header_)
      ++header_->count;
  }

  rc(rc &&other) noexcept
      : header_(std::exchange(other.header_, nullptr)),
        ptr_(std::exchange(other.ptr_, nullptr)) {}

  template <typename U>
    requires std::convertible_to<U *, T *>
  rc(const rc<U> &other) noexcept : header_(other.header_), ptr_(other.ptr_) {
    if (header_)
      ++header_->count;
  }

  template <typename U>
    requires std::convertible_to<U *, T *>
  rc(rc<U> &&other) noexcept
      : header_(std::exchange(other.header_, nullptr)),
        ptr_(std::exchange(other.ptr_, nullptr)) {}

  rc &operator=(const rc &other) noexcept {
    rc(other).swap(*this);
    return *this;
  }

  rc &operator=(rc &&other) noexcept {
    rc(std::move(other)).swap(*this);
    return *this;
  }

  template <typename U>
    requires std::convertible_to<U *, T *>
  rc &operator=(const rc<U> &other) noexcept {
    rc(other).swap(*this);
    return *this;
  }

  template <typename U>
    requires std::convertible_to<U *, T *>
  rc &operator=(rc<U> &&other) noexcept {
    rc(std::move(other)).swap(*this);
    return *this;
  }

  ~rc() { release(); }

  void reset() noexcept { release(); }

  void swap(rc &other) noexcept {
    std::swap(header_, other.header_);
    std::swap(ptr_, other.ptr_);
  }

  T *get() const noexcept { return ptr_; }

  T &operator*() const noexcept { return *ptr_; }
  T *operator->() const noexcept { return ptr_; }

  long use_count() const noexcept {
    return header_ ? static_cast<long>(header_->count) : 0;
  }

  explicit operator bool() const noexcept { return ptr_ != nullptr; }

  template <typename U>
  bool operator==(const rc<U> &other) const noexcept {
    return ptr_ == other.get();
  }

  friend bool operator==(const rc &a, std::nullptr_t) noexcept {
    return a.ptr_ == nullptr;
  }
};

template <typename T, typename... Args> rc<T> make_rc(Args &&...args) {
  using block_type = detail::rc_block<T>;
  using block_allocator = heap_allocator<block_type>;
  using block_traits = std::allocator_traits<block_allocator>;

  block_allocator alloc;
  block_type *block = block_traits::allocate(alloc, 1);
  try {
    block_traits::construct(alloc, block, std::forward<Args>(args)...);
  } catch (...) {
    block_traits::deallocate(alloc, block, 1);
    throw;
  }
  return rc<T>(block, &block->value);
}

template <typename T> void swap(rc<T> &a, rc<T> &b) noexcept { a.swap(b); }

} // namespace maybesync::local

#endif // MAYBESYNC_LOCAL_RC_HPP
