#pragma once

#include "yule/day.hpp"
#include "yule/simd.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <span>
#include <string_view>

/*
 * IDs are checked for being made of a single block of digits, repeated. E.g. 6464 ("64" twice),
 * 123123 ("123" twice) or 1111111 ("1" seven times). Such IDs are invalid.
 *
 * Part 1 only considers IDs that are one block repeated exactly twice. Part 2 considers any number
 * of repeats. The answer is the number and the sum of all invalid IDs in the input's ranges.
 */

namespace yule {

  /// How many repeats of a block make an ID invalid.
  enum class repeat_mode_t : uint8_t {
    two,       ///< Only a block repeated exactly twice, i.e. both halves are equal.
    multiple,  ///< A block repeated any number (>= 2) of times.
  };

  /// Resolves a mode name ("two" or "multiple"). Anything else resolves to repeat_mode_t::two.
  repeat_mode_t parse_repeat_mode(std::string_view name);

  std::string_view repeat_mode_name(repeat_mode_t mode);

  /// Inclusive range of IDs. A range with first > last is empty.
  struct id_range_t {
    uint64_t first;
    uint64_t last;

    friend bool operator==(id_range_t const &, id_range_t const &) = default;
  };

  /// Number and sum of the invalid IDs seen so far.
  struct invalid_tally_t {
    uint64_t count = 0;
    uint64_t sum = 0;

    invalid_tally_t & operator+=(invalid_tally_t const & other) {
      count += other.count;
      sum += other.sum;
      return *this;
    }

    friend invalid_tally_t operator+(invalid_tally_t lhs, invalid_tally_t const & rhs) {
      lhs += rhs;
      return lhs;
    }

    friend bool operator==(invalid_tally_t const &, invalid_tally_t const &) = default;
  };

  /** @brief Parses a list of ranges such as "11-22,95-115, 998-1012".
   *
   * Whitespace around each range is ignored. An empty input gives an empty list.
   *
   * @throws parse_error If any entry is not of the form `<digits>-<digits>`, or a bound doesn't
   * fit in 64 bits.
   */
  simd_vector_t<id_range_t> parse_id_ranges(simd_string_view_t input);

  /** @brief Returns whether an ID is valid, i.e. it is not a single block of digits repeated.
   *
   * Under repeat_mode_t::two only a split into two equal halves is tried. Under
   * repeat_mode_t::multiple every block count that divides the number of digits is tried. Never
   * fails: 0 and single-digit IDs are always valid.
   */
  bool is_valid_id(uint64_t id, repeat_mode_t mode);

  /// Tallies the invalid IDs in a single range.
  invalid_tally_t tally_invalid_ids(id_range_t const & range, repeat_mode_t mode);

  /// Tallies the invalid IDs over all ranges, one range after the other.
  invalid_tally_t tally_invalid_ids(std::span<id_range_t const> ranges, repeat_mode_t mode);

  /** @brief Same result as tally_invalid_ids(), but ranges are cut into chunks that are processed
   * on all available threads.
   */
  invalid_tally_t tally_invalid_ids_parallel(std::span<id_range_t const> ranges,
                                             repeat_mode_t mode);

  template <>
  struct day_t<2> {
    invalid_tally_t solve(part_t<1>, version_t<0>, simd_string_view_t input);
    invalid_tally_t solve(part_t<1>, version_t<1>, simd_string_view_t input);

    invalid_tally_t solve(part_t<2>, version_t<0>, simd_string_view_t input);
    invalid_tally_t solve(part_t<2>, version_t<1>, simd_string_view_t input);
  };

}  // namespace yule

template <>
struct fmt::formatter<yule::id_range_t> : fmt::formatter<std::string_view> {
  auto format(yule::id_range_t const & obj, fmt::format_context & ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}-{}", obj.first, obj.last);
  }
};

// Also the format of the day's solution files.
template <>
struct fmt::formatter<yule::invalid_tally_t> : fmt::formatter<std::string_view> {
  auto format(yule::invalid_tally_t const & obj, fmt::format_context & ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "count={} sum={}", obj.count, obj.sum);
  }
};
