#pragma once

#include "yule/day.hpp"
#include "yule/simd.hpp"

#include <cstdint>
#include <string_view>

/*
 * Each input line is a bank of batteries, one digit (its joltage) per battery. Turning on exactly
 * N batteries of a bank produces the number formed by their digits, in bank order. The answer is
 * the sum over all banks of the largest number they can produce: N = 2 for part 1, N = 12 for
 * part 2.
 */

namespace yule {

  /** @brief Returns the largest number that can be formed by picking `num_batteries` digits of
   * `bank` without reordering them.
   *
   * @throws parse_error If `bank` contains a non-digit or has fewer than `num_batteries` digits.
   */
  uint64_t max_joltage(version_t<0>, std::string_view bank, unsigned num_batteries);
  uint64_t max_joltage(version_t<1>, std::string_view bank, unsigned num_batteries);

  template <>
  struct day_t<3> {
    uint64_t solve(part_t<1>, version_t<0>, simd_string_view_t input);
    uint64_t solve(part_t<1>, version_t<1>, simd_string_view_t input);

    uint64_t solve(part_t<2>, version_t<0>, simd_string_view_t input);
    uint64_t solve(part_t<2>, version_t<1>, simd_string_view_t input);
  };

}  // namespace yule
