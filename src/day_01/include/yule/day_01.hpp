#pragma once

#include "yule/day.hpp"
#include "yule/simd.hpp"

#include <cstdint>

/*
 * A dial with positions 0-99 starts at 50 and is rotated left (towards lower numbers) or right by
 * the distances in the input, one rotation per line: "L68", "R48", ...
 *
 * Part 1 counts the rotations that leave the dial at 0. Part 2 counts every click at which the dial
 * points at 0, including clicks in the middle of a rotation.
 */

namespace yule {

  enum class rotation_direction_t : uint8_t {
    left,
    right,
  };

  struct rotation_t {
    rotation_direction_t direction;
    uint32_t distance;

    friend bool operator==(rotation_t const &, rotation_t const &) = default;
  };

  /// @throws parse_error If a line is not 'L' or 'R' followed by a distance.
  simd_vector_t<rotation_t> parse_rotations(simd_string_view_t input);

  /// Dial position and the number of times it has pointed at 0.
  struct dial_t {
    static constexpr uint32_t num_positions = 100;
    static constexpr uint32_t start_position = 50;

    uint32_t position = start_position;

    /// Rotates the dial. Returns the number of clicks that land on 0, the final one included.
    uint32_t rotate(rotation_t const & rotation);
  };

  template <>
  struct day_t<1> {
    uint64_t solve(part_t<1>, simd_string_view_t input);
    uint64_t solve(part_t<2>, simd_string_view_t input);
  };

}  // namespace yule
