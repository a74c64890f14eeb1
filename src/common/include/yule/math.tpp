#pragma once

#include "yule/math.hpp"  // Only for IDE.

#include <algorithm>
#include <array>
#include <cassert>
#include <iterator>

namespace yule {

  namespace detail {

    inline constexpr auto powers_of_10 = std::to_array<uint64_t>({
        1ULL,
        10ULL,
        100ULL,
        1'000ULL,
        10'000ULL,
        100'000ULL,
        1'000'000ULL,
        10'000'000ULL,
        100'000'000ULL,
        1'000'000'000ULL,
        10'000'000'000ULL,
        100'000'000'000ULL,
        1'000'000'000'000ULL,
        10'000'000'000'000ULL,
        100'000'000'000'000ULL,
        1'000'000'000'000'000ULL,
        10'000'000'000'000'000ULL,
        100'000'000'000'000'000ULL,
        1'000'000'000'000'000'000ULL,
        10'000'000'000'000'000'000ULL,
    });

  }  // namespace detail

  template <std::integral T, std::integral U>
  constexpr T mod(T value, U modulus) {
    assert(modulus > 0);
    auto const cast_mod = static_cast<T>(modulus);
    return ((value % cast_mod) + cast_mod) % cast_mod;
  }

  constexpr uint64_t power_of_10(unsigned exponent) {
    assert(exponent < detail::powers_of_10.size());
    return detail::powers_of_10[exponent];
  }

  /* Binary search for the first power of ten above the value; its exponent is the digit count. Zero
   * has to be special-cased, since 10^0 is already above it.
   */
  constexpr unsigned num_digits(uint64_t value) {
    if (value == 0) {
      return 1;
    }

    auto const above = std::ranges::upper_bound(detail::powers_of_10, value);
    return static_cast<unsigned>(std::distance(detail::powers_of_10.begin(), above));
  }

}  // namespace yule
