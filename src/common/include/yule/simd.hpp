#pragma once

#include "yule/memory.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace yule {

  static constexpr size_t simd_alignment_bytes = 512 / 8;

  template <size_t Alignment>
  using aligned_string_t =
      std::basic_string<char, std::char_traits<char>, aligned_allocator<char, Alignment>>;

  /** @brief A string whose buffer is aligned to yule::simd_alignment_bytes and padded such that
   * unaligned SIMD loads from any character stay inside the allocation.
   */
  using simd_string_t = aligned_string_t<simd_alignment_bytes>;

  template <class T>
  using simd_vector_t = std::vector<T, aligned_allocator<T, simd_alignment_bytes>>;

  template <class T>
  using simd_aligned_span_t = aligned_span<simd_alignment_bytes, T>;

  /// Read-only view into a simd_string_t. This is what solvers receive as input.
  using simd_string_view_t = simd_aligned_span_t<char const>;

  inline std::string_view as_string_view(simd_string_view_t view) {
    return {view.data(), view.size()};
  }

  /// Copies text into a simd_string_t. Reserving at least one SIMD block keeps short strings out
  /// of the small-string buffer, which is neither aligned nor padded.
  inline simd_string_t to_simd_string(std::string_view text) {
    simd_string_t result;
    result.reserve(std::max(text.size(), simd_alignment_bytes));
    result.append(text);
    return result;
  }

}  // namespace yule
