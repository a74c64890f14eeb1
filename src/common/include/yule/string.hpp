#pragma once

#include "yule/simd.hpp"

#include <concepts>
#include <span>
#include <stdexcept>
#include <string_view>

namespace yule {

  /// Thrown when input text does not have the expected format.
  struct parse_error : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
  };

  /// Strips leading and trailing whitespace.
  template <class StringLike>
    requires requires(StringLike s) {
      { s.substr(0, 1) } -> std::same_as<StringLike>;
    }
  StringLike trim(StringLike s);

  /** @brief Converts the complete string to an integer.
   *
   * @throws parse_error If `str` is empty, contains anything but digits (and a leading minus sign
   * for signed types), or if the value does not fit in `T`.
   */
  template <std::integral T>
  T to_int(std::string_view str);

  /** @brief Splits `input` at every occurrence of `splitter`, without copying.
   *
   * A splitter at the very end of the input does not produce an empty trailing entry. Empty
   * entries between two consecutive splitters are kept.
   *
   * @param output Storage for the resulting views. Must have room for at least
   * `count(input, splitter) + 1` entries.
   * @returns The prefix of `output` that was filled in.
   */
  std::span<simd_string_view_t> split_lines(simd_string_view_t input,
                                            std::span<simd_string_view_t> output,
                                            char splitter = '\n');

  /// Same as above, but allocates the output storage itself.
  simd_vector_t<simd_string_view_t> split(simd_string_view_t input, char splitter = '\n');

}  // namespace yule

#include "yule/string.tpp"
