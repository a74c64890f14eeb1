#include "yule/day_01.hpp"
#include "yule/string.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>

namespace {

  using namespace yule;

  constexpr std::string_view example = "L68\nL30\nR48\nL5\nR60\nL55\nL1\nL99\nR14\nL82\n";

  rotation_t left(uint32_t distance) {
    return {rotation_direction_t::left, distance};
  }

  rotation_t right(uint32_t distance) {
    return {rotation_direction_t::right, distance};
  }

  simd_vector_t<rotation_t> parse(std::string_view text) {
    auto const input = to_simd_string(text);
    return parse_rotations(input);
  }

}  // namespace

TEST(day_01, parse_rotations) {
  auto const rotations = parse("L68\nR48\n\nL5\n");

  ASSERT_EQ(rotations.size(), 3u);
  EXPECT_EQ(rotations[0], left(68));
  EXPECT_EQ(rotations[1], right(48));
  EXPECT_EQ(rotations[2], left(5));
}

TEST(day_01, parse_rotations_rejects_malformed_lines) {
  EXPECT_THROW(parse("X10\n"), parse_error);
  EXPECT_THROW(parse("L\n"), parse_error);
  EXPECT_THROW(parse("R1x\n"), parse_error);
}

TEST(day_01, dial_counts_clicks_on_zero) {
  dial_t dial;
  EXPECT_EQ(dial.rotate(left(68)), 1u);  // Passes 0 once, ends on 82.
  EXPECT_EQ(dial.position, 82u);

  EXPECT_EQ(dial.rotate(left(30)), 0u);
  EXPECT_EQ(dial.position, 52u);

  EXPECT_EQ(dial.rotate(right(48)), 1u);  // Ends on 0.
  EXPECT_EQ(dial.position, 0u);

  EXPECT_EQ(dial.rotate(left(5)), 0u);  // Leaving 0 doesn't count.
  EXPECT_EQ(dial.position, 95u);
}

TEST(day_01, dial_full_turns) {
  dial_t dial;
  EXPECT_EQ(dial.rotate(right(1000)), 10u);
  EXPECT_EQ(dial.position, 50u);

  EXPECT_EQ(dial.rotate(left(250)), 3u);
  EXPECT_EQ(dial.position, 0u);

  EXPECT_EQ(dial.rotate(left(100)), 1u);
  EXPECT_EQ(dial.position, 0u);
}

TEST(day_01, example) {
  auto const input = to_simd_string(example);
  day_t<1> day;

  EXPECT_EQ(day.solve(part<1>, input), 3u);
  EXPECT_EQ(day.solve(part<2>, input), 6u);
}
