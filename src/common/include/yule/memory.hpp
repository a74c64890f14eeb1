#pragma once

#include <cstddef>
#include <memory>
#include <ranges>
#include <span>
#include <type_traits>

namespace yule {

  /** @brief STL allocator returning memory aligned to `Alignment` bytes.
   *
   * Every allocation is rounded up to a multiple of the alignment and gets one extra block of
   * `Alignment` bytes at the end. A full SIMD register can therefore be loaded starting at any
   * element of the container without reading past the allocation. The padding is zero-filled.
   */
  template <class T, size_t Alignment>
  struct aligned_allocator {
    static_assert((Alignment & (Alignment - 1)) == 0, "Alignment must be power of 2");
    static_assert(Alignment >= alignof(T), "Alignment must be at least alignof(T)");

    using value_type = T;
    using size_type = size_t;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    static constexpr size_t alignment = Alignment;

    template <class U>
    struct rebind {
      using other = aligned_allocator<U, Alignment>;
    };

    aligned_allocator() = default;

    template <class U>
    aligned_allocator(aligned_allocator<U, Alignment> const &) noexcept {}

    T * allocate(size_type n);
    void deallocate(T * ptr, size_type) noexcept;
  };

  template <class T, class U, size_t AlignmentLhs, size_t AlignmentRhs>
  bool operator==(aligned_allocator<T, AlignmentLhs> const &,
                  aligned_allocator<U, AlignmentRhs> const &) noexcept {
    return AlignmentLhs == AlignmentRhs;
  }

  namespace detail {

    // A range whose storage comes from an aligned_allocator with the given alignment.
    template <class Rng, size_t Alignment>
    concept aligned_range =
        std::ranges::contiguous_range<Rng> &&
        std::uses_allocator_v<std::remove_cvref_t<Rng>,
                              aligned_allocator<std::ranges::range_value_t<Rng>, Alignment>>;

  }  // namespace detail

  /** @brief A span into memory owned by an aligned_allocator. Only the start of the owning
   * container is aligned, but loads of `Alignment` bytes from any element stay inside the
   * allocation.
   */
  template <size_t Alignment, class T>
  class aligned_span : public std::span<T> {
   private:
    using base_t = std::span<T>;

   public:
    aligned_span() = default;

    aligned_span(T * data, size_t size)
        : base_t(data, size) {}

    template <class Rng>
      requires detail::aligned_range<Rng, Alignment> && (!std::is_rvalue_reference_v<Rng &&>)
    aligned_span(Rng && rng)
        : base_t(std::ranges::data(rng), std::ranges::size(rng)) {}

    /// Returns the sub-span [offset, offset + count), still backed by the padded allocation.
    aligned_span subspan(size_t offset, size_t count) const {
      return aligned_span(this->data() + offset, count);
    }
  };

}  // namespace yule

#include "yule/memory.tpp"
