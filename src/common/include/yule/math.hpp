#pragma once

#include <concepts>
#include <cstdint>

namespace yule {

  /// @brief Calculate the non-negative mod(value, modulus).
  template <std::integral T, std::integral U>
  constexpr T mod(T value, U modulus);

  /// @brief Returns 10^exponent. Valid for exponents 0 through 19.
  constexpr uint64_t power_of_10(unsigned exponent);

  /// @brief Returns the number of decimal digits of `value`. Zero has a single digit.
  constexpr unsigned num_digits(uint64_t value);

}  // namespace yule

#include "yule/math.tpp"
