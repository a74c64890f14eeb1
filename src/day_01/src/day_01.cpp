#include "yule/day_01.hpp"

#include "yule/math.hpp"
#include "yule/string.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <string_view>

namespace yule {

  simd_vector_t<rotation_t> parse_rotations(simd_string_view_t input) {
    auto const lines = split(input, '\n');

    simd_vector_t<rotation_t> result;
    result.reserve(lines.size());

    for (auto const & line : lines) {
      auto const text = as_string_view(line);
      if (text.empty()) {
        continue;
      }

      rotation_t rotation;
      if (text.front() == 'L') {
        rotation.direction = rotation_direction_t::left;
      } else if (text.front() == 'R') {
        rotation.direction = rotation_direction_t::right;
      } else {
        throw parse_error(fmt::format("Invalid rotation '{}': expected 'L' or 'R'", text));
      }

      try {
        rotation.distance = to_int<uint32_t>(text.substr(1));
      } catch (parse_error const & ex) {
        throw parse_error(fmt::format("Invalid rotation '{}': {}", text, ex.what()));
      }

      result.push_back(rotation);
    }

    SPDLOG_DEBUG("Parsed {} rotations", result.size());
    return result;
  }

  uint32_t dial_t::rotate(rotation_t const & rotation) {
    uint64_t travelled;

    if (rotation.direction == rotation_direction_t::left) {
      // Mirror the dial, so that turning left becomes turning right.
      uint32_t const mirrored = (num_positions - position) % num_positions;
      travelled = uint64_t{mirrored} + rotation.distance;
      position = static_cast<uint32_t>(
          mod(static_cast<int64_t>(position) - rotation.distance, num_positions));
    } else {
      travelled = uint64_t{position} + rotation.distance;
      position = static_cast<uint32_t>(travelled % num_positions);
    }

    assert(position < num_positions);
    return static_cast<uint32_t>(travelled / num_positions);
  }

  uint64_t day_t<1>::solve(part_t<1>, simd_string_view_t input) {
    auto const rotations = parse_rotations(input);

    dial_t dial;
    uint64_t at_zero = 0;

    for (auto const & rotation : rotations) {
      dial.rotate(rotation);
      at_zero += (dial.position == 0);
    }

    return at_zero;
  }

  uint64_t day_t<1>::solve(part_t<2>, simd_string_view_t input) {
    auto const rotations = parse_rotations(input);

    dial_t dial;
    uint64_t passed_zero = 0;

    for (auto const & rotation : rotations) {
      auto const clicks = dial.rotate(rotation);
      SPDLOG_TRACE("rotated to {}, {} clicks on zero", dial.position, clicks);
      passed_zero += clicks;
    }

    return passed_zero;
  }

}  // namespace yule
