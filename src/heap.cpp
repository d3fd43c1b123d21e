#include "maybesync/heap.hpp"

#include <mimalloc.h>

namespace maybesync {

void *heap_allocate(std::size_t bytes, std::size_t alignment) {
  void *p = mi_malloc_aligned(bytes, alignment);
  if (!p)
    throw std::bad_alloc();
  return p;
}

void heap_deallocate(void *p, std::size_t alignment) noexcept {
  mi_free_aligned(p, alignment);
}

} // namespace maybesync
