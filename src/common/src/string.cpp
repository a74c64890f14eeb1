#include "yule/string.hpp"

#include <algorithm>
#include <bit>
#include <cassert>
#include <cstdint>

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "src/string.cpp"

// clang-format off
#include <hwy/foreach_target.h>
// clang-format on

#include <hwy/highway.h>

HWY_BEFORE_NAMESPACE();

namespace yule {
  namespace HWY_NAMESPACE {

    namespace hn = hwy::HWY_NAMESPACE;

    std::span<simd_string_view_t> split_lines(simd_string_view_t input,
                                              std::span<simd_string_view_t> output,
                                              char splitter) {
      static constexpr hn::ScalableTag<uint8_t> tag{};
      size_t const lane_size = hn::Lanes(tag);

      uint8_t const * HWY_RESTRICT data = reinterpret_cast<uint8_t const *>(input.data());
      auto const splitters = hn::Set(tag, static_cast<uint8_t>(splitter));
      size_t line_start = 0;
      size_t line_idx = 0;

      // The allocation is padded, so loads past input.size() are safe. Masking with FirstN keeps
      // whatever lives in that padding from being picked up as a splitter.
      for (size_t idx = 0; idx < input.size(); idx += lane_size) {
        auto const vec = hn::LoadU(tag, &data[idx]);
        auto const in_bounds = hn::FirstN(tag, input.size() - idx);
        auto const eq = hn::And(hn::Eq(vec, splitters), in_bounds);
        uint64_t bits = hn::BitsFromMask(tag, eq);

        for (; bits != 0; bits &= (bits - 1)) {
          size_t const bit_pos = std::countr_zero(bits);
          size_t const line_length = idx + bit_pos - line_start;

          assert(line_start + line_length <= input.size());
          assert(line_idx < output.size());

          output[line_idx++] = input.subspan(line_start, line_length);
          line_start += line_length + 1;  // +1 to skip the splitter.
        }
      }

      if (line_start < input.size()) {  // Last entry doesn't end with a splitter.
        assert(line_idx < output.size());
        output[line_idx++] = input.subspan(line_start, input.size() - line_start);
      }

      return output.first(line_idx);
    }

  }  // namespace HWY_NAMESPACE
}  // namespace yule

HWY_AFTER_NAMESPACE();

#ifdef HWY_ONCE

namespace yule {

  HWY_EXPORT(split_lines);

  std::span<simd_string_view_t> split_lines(simd_string_view_t input,
                                            std::span<simd_string_view_t> output,
                                            char splitter) {
    return HWY_DYNAMIC_DISPATCH(split_lines)(input, output, splitter);
  }

  simd_vector_t<simd_string_view_t> split(simd_string_view_t input, char splitter) {
    auto const num_splitters = std::ranges::count(input, splitter);

    simd_vector_t<simd_string_view_t> result(num_splitters + 1);
    auto const used = split_lines(input, result, splitter);
    result.resize(used.size());

    return result;
  }

}  // namespace yule

#endif  // HWY_ONCE
