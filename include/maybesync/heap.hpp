#ifndef MAYBESYNC_HEAP_HPP
#define MAYBESYNC_HEAP_HPP

#include <cstddef>
#include <new>

#include "config.hpp"

#if !MAYBESYNC_ALLOC
#error "maybesync/heap.hpp requires MAYBESYNC_ALLOC=1"
#endif

namespace maybesync {

// Heap used by rc and make_rc in both modes, backed by mimalloc.
// Throws std::bad_alloc on exhaustion.
void *heap_allocate(std::size_t bytes, std::size_t alignment);

void heap_deallocate(void *p, std::size_t alignment) noexcept;

// Standard allocator over heap_allocate, for allocate_shared and friends.
template <typename T> struct heap_allocator {
  using value_type = T;

  heap_allocator() noexcept = default;

  template <typename U>
  heap_allocator(const heap_allocator<U> &) noexcept {}

  T *allocate(std::size_t n) {
    if (n > static_cast<std::size_t>(-1) / sizeof(T))
      throw std::bad_array_new_length();
    return static_cast<T *>(heap_allocate(n * sizeof(T), alignof(T)));
  }

  void deallocate(T *p, std::size_t /*n*/) noexcept {
    heap_deallocate(p, alignof(T));
  }

  template <typename U>
  bool operator==(const heap_allocator<U> &) const noexcept {
    return true;
  }
};

} // namespace maybesync

#endif // MAYBESYNC_HEAP_HPP
