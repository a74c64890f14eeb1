#include "yule/day_03.hpp"
#include "yule/string.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>

namespace {

  using namespace yule;

  constexpr std::string_view example =
      "987654321111111\n811111111111119\n234234234234278\n818181911112111\n";

  // Runs both versions and checks that they agree.
  uint64_t joltage(std::string_view bank, unsigned num_batteries) {
    auto const greedy = max_joltage(version<0>, bank, num_batteries);
    EXPECT_EQ(max_joltage(version<1>, bank, num_batteries), greedy) << bank;
    return greedy;
  }

}  // namespace

TEST(day_03, two_batteries) {
  EXPECT_EQ(joltage("987654321111111", 2), 98u);
  EXPECT_EQ(joltage("811111111111119", 2), 89u);
  EXPECT_EQ(joltage("234234234234278", 2), 78u);
  EXPECT_EQ(joltage("818181911112111", 2), 92u);
  EXPECT_EQ(joltage("123456", 2), 56u);
  EXPECT_EQ(joltage("91", 2), 91u);
}

TEST(day_03, twelve_batteries) {
  EXPECT_EQ(joltage("987654321111111", 12), 987654321111u);
  EXPECT_EQ(joltage("811111111111119", 12), 811111111119u);
  EXPECT_EQ(joltage("234234234234278", 12), 434234234278u);
  EXPECT_EQ(joltage("818181911112111", 12), 888911112111u);
}

TEST(day_03, equal_digits_prefer_earliest) {
  EXPECT_EQ(joltage("9919", 2), 99u);
  EXPECT_EQ(joltage("1999", 3), 999u);
  EXPECT_EQ(joltage("55555", 5), 55555u);
}

TEST(day_03, invalid_banks) {
  EXPECT_THROW(max_joltage(version<0>, "9", 2), parse_error);
  EXPECT_THROW(max_joltage(version<1>, "9", 2), parse_error);
  EXPECT_THROW(max_joltage(version<0>, "12a4", 2), parse_error);
  EXPECT_THROW(max_joltage(version<1>, "12 4", 2), parse_error);
}

TEST(day_03, example) {
  auto const input = to_simd_string(example);
  day_t<3> day;

  EXPECT_EQ(day.solve(part<1>, version<0>, input), 357u);
  EXPECT_EQ(day.solve(part<1>, version<1>, input), 357u);
  EXPECT_EQ(day.solve(part<2>, version<0>, input), 3121910778619u);
  EXPECT_EQ(day.solve(part<2>, version<1>, input), 3121910778619u);
}
