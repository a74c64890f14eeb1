#include "yule/check.hpp"
#include "yule/day.hpp"
#include "yule/file.hpp"
#include "yule/logging.hpp"
#include "yule/math.hpp"
#include "yule/simd.hpp"
#include "yule/string.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace {

  using namespace yule;

  namespace fs = std::filesystem;

  // Fresh directory below the system temp dir, removed again when the test ends.
  class temp_dir_test : public ::testing::Test {
   protected:
    void SetUp() override {
      auto const * const info = ::testing::UnitTest::GetInstance()->current_test_info();
      dir_ = fs::temp_directory_path() /
             (std::string{"yule-"} + info->test_suite_name() + "-" + info->name());
      fs::remove_all(dir_);
      fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path write(std::string_view name, std::string_view contents) const {
      auto const path = dir_ / name;
      std::ofstream{path, std::ios::binary} << contents;
      return path;
    }

    fs::path dir_;
  };

  std::vector<std::string> to_strings(simd_vector_t<simd_string_view_t> const & views) {
    std::vector<std::string> result;
    for (auto const & view : views) {
      result.emplace_back(as_string_view(view));
    }
    return result;
  }

}  // namespace

TEST(math, num_digits) {
  EXPECT_EQ(num_digits(0), 1u);
  EXPECT_EQ(num_digits(1), 1u);
  EXPECT_EQ(num_digits(9), 1u);
  EXPECT_EQ(num_digits(10), 2u);
  EXPECT_EQ(num_digits(99), 2u);
  EXPECT_EQ(num_digits(100), 3u);
  EXPECT_EQ(num_digits(1'188'511'885), 10u);
  EXPECT_EQ(num_digits(9'999'999'999'999'999'999ULL), 19u);
  EXPECT_EQ(num_digits(10'000'000'000'000'000'000ULL), 20u);
  EXPECT_EQ(num_digits(std::numeric_limits<uint64_t>::max()), 20u);

  // Every power of ten and the value just below it.
  for (unsigned exponent = 1; exponent < 20; ++exponent) {
    EXPECT_EQ(num_digits(power_of_10(exponent)), exponent + 1) << "10^" << exponent;
    EXPECT_EQ(num_digits(power_of_10(exponent) - 1), exponent) << "10^" << exponent << " - 1";
  }
}

TEST(math, power_of_10) {
  EXPECT_EQ(power_of_10(0), 1u);
  EXPECT_EQ(power_of_10(3), 1'000u);
  EXPECT_EQ(power_of_10(19), 10'000'000'000'000'000'000ULL);
}

TEST(math, mod_is_never_negative) {
  EXPECT_EQ(mod(-1, 100), 99);
  EXPECT_EQ(mod(-100, 100), 0);
  EXPECT_EQ(mod(-168, 100), 32);
  EXPECT_EQ(mod(250, 100), 50);
}

TEST(string, trim) {
  EXPECT_EQ(trim(std::string_view{"  11-22\n"}), "11-22");
  EXPECT_EQ(trim(std::string_view{"\t\r\n "}), "");
  EXPECT_EQ(trim(std::string_view{""}), "");
  EXPECT_EQ(trim(std::string{"a b"}), "a b");
}

TEST(string, to_int) {
  EXPECT_EQ(to_int<uint64_t>("0"), 0u);
  EXPECT_EQ(to_int<uint64_t>("18446744073709551615"), std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(to_int<int>("-42"), -42);
}

TEST(string, to_int_rejects_partial_and_invalid_numbers) {
  EXPECT_THROW(to_int<uint64_t>(""), parse_error);
  EXPECT_THROW(to_int<uint64_t>("12a"), parse_error);
  EXPECT_THROW(to_int<uint64_t>(" 12"), parse_error);
  EXPECT_THROW(to_int<uint64_t>("-1"), parse_error);
  EXPECT_THROW(to_int<uint64_t>("18446744073709551616"), parse_error);
  EXPECT_THROW(to_int<uint8_t>("256"), parse_error);
}

TEST(string, split_keeps_empty_entries_but_not_a_trailing_one) {
  auto const input = to_simd_string("a,,bc,\n,");
  EXPECT_EQ(to_strings(split(input, ',')), (std::vector<std::string>{"a", "", "bc", "\n"}));
}

TEST(string, split_lines) {
  auto const input = to_simd_string("L68\nL30\n\nR48\n");
  EXPECT_EQ(to_strings(split(input)), (std::vector<std::string>{"L68", "L30", "", "R48"}));

  auto const single = to_simd_string("no splitter");
  EXPECT_EQ(to_strings(split(single)), (std::vector<std::string>{"no splitter"}));

  auto const empty = to_simd_string("");
  EXPECT_TRUE(split(empty).empty());
}

TEST(string, split_across_simd_blocks) {
  // Entries straddle the boundaries of 16, 32 and 64 byte loads.
  std::string text;
  std::vector<std::string> expected;
  for (unsigned idx = 0; idx < 100; ++idx) {
    expected.push_back(std::string(idx % 7, 'x') + std::to_string(idx));
    text += expected.back();
    text += ',';
  }

  auto const input = to_simd_string(text);
  EXPECT_EQ(to_strings(split(input, ',')), expected);
}

TEST(check, throws_on_failure) {
  scoped_log_level const quiet{spdlog::level::off};

  EXPECT_NO_THROW(check(true, "never shown"));
  EXPECT_THROW(check(false, "value {} is wrong", 42), check_failure);

  try {
    check(false, "value {} is wrong", 42);
  } catch (check_failure const & ex) {
    EXPECT_STREQ(ex.what(), "value 42 is wrong");
  }
}

TEST(logging, scoped_log_level_restores_previous_level) {
  spdlog::set_level(spdlog::level::info);
  {
    scoped_log_level const quiet{spdlog::level::err};
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
  }
  EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}

TEST_F(temp_dir_test, read_file_trims_and_appends_newline) {
  auto const path = write("input.txt", "\n  11-22,95-115  \n\n");
  auto const contents = read_file(path);

  EXPECT_EQ(std::string_view(contents.data(), contents.size()), "11-22,95-115\n");
  EXPECT_EQ(reinterpret_cast<uintptr_t>(contents.data()) % simd_alignment_bytes, 0u);
}

TEST_F(temp_dir_test, read_file_of_missing_file_throws) {
  EXPECT_THROW(read_file(dir_ / "does-not-exist.txt"), file_read_error);
}

TEST_F(temp_dir_test, resolve_symlink_follows_chains) {
  auto const target = write("target.txt", "x");
  fs::create_symlink("target.txt", dir_ / "first.txt");
  fs::create_symlink("first.txt", dir_ / "second.txt");

  EXPECT_EQ(resolve_symlink(dir_ / "second.txt").string(), target.string());
  EXPECT_EQ(resolve_symlink(target).string(), target.string());
}

TEST_F(temp_dir_test, example_file_paths) {
  write("day_02-part_1-example_1.txt", "11-22");
  write("day_02-part_1-example_1-solution.txt", "count=2 sum=33");
  write("day_02-part_1-example_10.txt", "11-11");
  write("day_02-part_1-example_10-solution.txt", "count=1 sum=11");
  write("day_02-part_1-example_2.txt", "22-22");
  write("day_02-part_1-example_2-solution.txt", "count=1 sum=22");
  write("day_02-part_1-example_3.txt", "no solution, so skipped");
  write("day_02-part_2-example_1-solution.txt", "count=2 sum=33");
  write("day_02-part_1.txt", "puzzle input, not an example");
  fs::create_symlink("day_02-part_1-example_1.txt", dir_ / "day_02-part_2-example_1.txt");

  auto const part_1 = example_file_paths(dir_, 2, 1);
  ASSERT_EQ(part_1.size(), 3u);
  EXPECT_EQ(part_1[0].filename().string(), "day_02-part_1-example_1.txt");
  EXPECT_EQ(part_1[1].filename().string(), "day_02-part_1-example_2.txt");
  EXPECT_EQ(part_1[2].filename().string(), "day_02-part_1-example_10.txt");

  auto const part_2 = example_file_paths(dir_, 2, 2);
  ASSERT_EQ(part_2.size(), 1u);
  EXPECT_EQ(part_2[0].filename().string(), "day_02-part_2-example_1.txt");

  EXPECT_TRUE(example_file_paths(dir_, 3, 1).empty());
  EXPECT_TRUE(example_file_paths(dir_ / "missing", 2, 1).empty());
}

TEST(day, file_names) {
  EXPECT_EQ(input_file_path("inputs", 2, 1).string(), "inputs/day_02-part_1.txt");
  EXPECT_EQ(solution_file_path("inputs/day_02-part_1-example_3.txt").string(),
            "inputs/day_02-part_1-example_3-solution.txt");
  EXPECT_EQ(example_number("inputs/day_02-part_1-example_12.txt"), 12u);
  EXPECT_THROW(example_number("inputs/day_02-part_1.txt"), parse_error);
}
