#pragma once

#include "yule/memory.hpp"  // Enable IDE syntax highlighting.

#include <cassert>
#include <cstdlib>
#include <cstring>
#include <new>

namespace yule {

  template <class T, size_t Alignment>
  T * aligned_allocator<T, Alignment>::allocate(size_type n) {
    size_t const used = n * sizeof(T);
    size_t size = (used + (Alignment - 1)) / Alignment * Alignment;
    size += Alignment;  // Room for a SIMD load starting at the last element.
    assert(size % Alignment == 0);

    void * ptr = std::aligned_alloc(Alignment, size);
    if (!ptr) {
      throw std::bad_alloc();
    }

    // Zero the tail so that over-reading loads see NUL characters instead of garbage.
    std::memset(static_cast<char *>(ptr) + used, 0, size - used);
    return static_cast<T *>(ptr);
  }

  template <class T, size_t Alignment>
  void aligned_allocator<T, Alignment>::deallocate(T * ptr, size_type) noexcept {
    std::free(ptr);
  }

}  // namespace yule
