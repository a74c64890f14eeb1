#include "yule/runner_days.hpp"

#include "yule/day.hpp"
#include "yule/file.hpp"
#include "yule/logging.hpp"
#include "yule/string.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace {

  using namespace yule;

  inline constexpr size_t no_version = static_cast<size_t>(-1);

  struct test_count_t {
    unsigned successful = 0;
    unsigned total = 0;

    test_count_t & operator+=(test_count_t const & other) {
      successful += other.successful;
      total += other.total;
      return *this;
    }

    void record(bool success) {
      successful += success;
      total += 1;
    }
  };

  // fmt::styled keeps a reference to its argument, so these must outlive the log call.
  constexpr std::string_view pass_text = "PASS";
  constexpr std::string_view fail_text = "FAIL";

  auto pass_fail(bool success) {
    return success ? fmt::styled(pass_text, fmt::fg(fmt::terminal_color::green))
                   : fmt::styled(fail_text, fmt::fg(fmt::terminal_color::red));
  }

  template <size_t Day, size_t Part, size_t Version>
  bool verify_example(std::string_view msg_prefix,
                      simd_string_t const & input,
                      size_t example,
                      std::string_view expected) {
    auto const version_str = (Version != no_version) ? fmt::format(" v{:d}", Version) : "";

    std::string actual;
    try {
      // Solvers may keep state, so always use a fresh day_t.
      day_t<Day> day{};
      if constexpr (Version != no_version) {
        actual = fmt::format("{}", day.solve(part<Part>, version<Version>, input));
      } else {
        actual = fmt::format("{}", day.solve(part<Part>, input));
      }
    } catch (std::exception const & ex) {
      spdlog::error("[{}{} - example {}] {} (exception: {})", msg_prefix, version_str, example,
                    pass_fail(false), ex.what());
      return false;
    }

    bool const success = (actual == expected);
    spdlog::info("[{}{} - example {}] {} (actual: {}, expected: {})", msg_prefix, version_str,
                 example, pass_fail(success), actual, expected);
    return success;
  }

  template <size_t Day, size_t Part>
  test_count_t verify_day_part() {
    using input_t = simd_string_t;
    test_count_t test_count;

    if constexpr (can_solve_part<Day, Part, input_t>) {
      static constexpr auto versions = version_info_for_part<Day, Part, input_t>;
      auto const msg_prefix = fmt::format("day {:02} - part {}", Day, Part);

      auto const example_files = example_file_paths(input_dir, Day, Part);
      if (example_files.empty()) {
        spdlog::warn("[{}] No example files found", msg_prefix);
        return test_count;
      }

      // Loop over examples first, then versions, so the output of different versions for the same
      // example ends up next to each other.
      for (auto const & example_file : example_files) {
        auto const expected = trim(read_file(solution_file_path(example_file)));
        auto const input = read_file(example_file);
        size_t const example = example_number(example_file);
        std::string_view const expected_view{expected.data(), expected.size()};

        if constexpr (versions.has_versions) {
          auto const invoker = [&]<size_t... Version>(std::index_sequence<Version...>) {
            (..., test_count.record(verify_example<Day, Part, Version>(msg_prefix, input, example,
                                                                       expected_view)));
          };
          invoker(std::make_index_sequence<versions.num_versions>{});
        } else {
          test_count.record(
              verify_example<Day, Part, no_version>(msg_prefix, input, example, expected_view));
        }
      }
    }

    return test_count;
  }

  template <size_t Day>
  test_count_t verify_day() {
    auto const invoker = []<size_t... Part>(std::index_sequence<Part...>) {
      test_count_t result;
      (..., (result += verify_day_part<Day, Part + 1>()));
      return result;
    };
    return invoker(std::make_index_sequence<max_parts>{});
  }

  template <size_t... Days>
  test_count_t verify_days() {
    test_count_t result;
    (..., (result += verify_day<Days>()));
    return result;
  }

}  // namespace

int main(int argc, char ** argv) {
  yule::setup_logging(argc, argv);

  test_count_t test_counts;
  try {
    test_counts = verify_days<DAY_NUMBERS>();
  } catch (std::exception const & ex) {  // E.g. unreadable example or solution file.
    spdlog::critical("{}", ex.what());
    return 1;
  }

  bool const success = (test_counts.total > 0) && (test_counts.total == test_counts.successful);
  spdlog::info("[summary] {} ({} passed, {} failed, {} total)", pass_fail(success),
               test_counts.successful, test_counts.total - test_counts.successful,
               test_counts.total);
  return success ? 0 : 1;
}
