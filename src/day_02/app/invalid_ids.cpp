#include "yule/runner_days.hpp"

#include "yule/check.hpp"
#include "yule/day.hpp"
#include "yule/day_02.hpp"
#include "yule/file.hpp"
#include "yule/logging.hpp"
#include "yule/string.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <string_view>

namespace {

  using namespace yule;

  struct options_t {
    std::filesystem::path input = input_file_path(input_dir, 2, 1);
    repeat_mode_t mode = repeat_mode_t::two;
    bool parallel = false;
    bool bench = false;
    uint32_t iterations = 1000;
    bool help = false;
  };

  void print_usage(std::string_view program) {
    fmt::print(
        "Usage: {} [options] [SPDLOG_LEVEL=<level>]\n"
        "\n"
        "Counts and sums the invalid IDs in a list of ID ranges.\n"
        "\n"
        "  -i, --input <path>        Input file (default: {})\n"
        "  -m, --mode <two|multiple> Repeats that make an ID invalid (default: two)\n"
        "  -p, --parallel            Spread the ranges over all cores\n"
        "  -b, --bench               Time repeated runs instead of printing the result\n"
        "  -n, --iterations <N>      Number of runs with --bench (default: 1000)\n"
        "  -h, --help                Show this message\n",
        program, input_file_path(input_dir, 2, 1));
  }

  options_t parse_options(int argc, char ** argv) {
    options_t options;

    for (int idx = 1; idx < argc; ++idx) {
      std::string_view const arg = argv[idx];

      auto const value = [&] {
        check(idx + 1 < argc, "Option {} requires a value", arg);
        return std::string_view{argv[++idx]};
      };

      if (arg.starts_with("SPDLOG_LEVEL=")) {
        continue;  // Handled by setup_logging().
      } else if (arg == "-i" || arg == "--input") {
        options.input = value();
      } else if (arg == "-m" || arg == "--mode") {
        options.mode = parse_repeat_mode(value());
      } else if (arg == "-p" || arg == "--parallel") {
        options.parallel = true;
      } else if (arg == "-b" || arg == "--bench") {
        options.bench = true;
      } else if (arg == "-n" || arg == "--iterations") {
        options.iterations = to_int<uint32_t>(value());
        check(options.iterations > 0, "Number of iterations must be positive");
      } else if (arg == "-h" || arg == "--help") {
        options.help = true;
      } else {
        check(false, "Unknown option '{}', see --help", arg);
      }
    }

    return options;
  }

  invalid_tally_t tally(simd_vector_t<id_range_t> const & ranges, options_t const & options) {
    return options.parallel ? tally_invalid_ids_parallel(ranges, options.mode)
                            : tally_invalid_ids(ranges, options.mode);
  }

  void run_benchmark(simd_vector_t<id_range_t> const & ranges, options_t const & options) {
    invalid_tally_t result;

    // Per-range debug output would dominate the measurement.
    scoped_log_level const quiet{spdlog::level::warn};

    spdlog::stopwatch const stopwatch;
    for (uint32_t iteration = 0; iteration < options.iterations; ++iteration) {
      result = tally(ranges, options);
    }
    auto const elapsed = std::chrono::duration<double, std::milli>(stopwatch.elapsed());

    spdlog::warn("{} iterations, mode: {}, result: {}", options.iterations,
                 repeat_mode_name(options.mode), result);
    spdlog::warn("total: {:.3f} ms, average: {:.6f} ms", elapsed.count(),
                 elapsed.count() / options.iterations);
  }

}  // namespace

int main(int argc, char ** argv) {
  yule::setup_logging(argc, argv);

  try {
    auto const options = parse_options(argc, argv);
    if (options.help) {
      print_usage(argv[0]);
      return 0;
    }

    auto const input = read_file(options.input);
    auto const ranges = parse_id_ranges(input);
    spdlog::info("Parsed {} ID ranges from {}", ranges.size(), options.input);

    if (options.bench) {
      run_benchmark(ranges, options);
    } else {
      auto const result = tally(ranges, options);
      spdlog::info("Mode: {}", repeat_mode_name(options.mode));
      spdlog::info("Total invalid IDs: {}", result.count);
      spdlog::info("Sum of invalid IDs: {}", result.sum);
    }
  } catch (std::exception const & ex) {
    spdlog::critical("{}", ex.what());
    return 1;
  }

  return 0;
}
