#include "yule/runner_days.hpp"

#include "yule/day.hpp"
#include "yule/file.hpp"
#include "yule/logging.hpp"

#include <benchmark/benchmark.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>

namespace {

  using namespace yule;

  inline constexpr size_t no_version = static_cast<size_t>(-1);

  template <size_t Day, size_t Part, size_t Version = no_version>
  void benchmark_day_part(benchmark::State & state) {
    auto const input_path = input_file_path(input_dir, Day, Part);

    // Skip benchmarks for which no input files exist.
    if (!std::filesystem::exists(input_path)) {
      auto const msg = fmt::format("Input file does not exist ({})", input_path);
      state.SkipWithError(msg.c_str());
      return;
    }

    auto const input = read_file(input_path);

    // Solvers log per range/line at debug level, which would dominate the measurement. The solvers
    // are compiled with their own SPDLOG_ACTIVE_LEVEL, so raising the runtime level is the only
    // way to silence them here.
    scoped_log_level const quiet{spdlog::level::warn};

    try {
      for (auto _ : state) {
        // Solvers may keep state, so always use a fresh day_t.
        day_t<Day> day{};

        if constexpr (Version == no_version) {
          benchmark::DoNotOptimize(day.solve(part<Part>, input));
        } else {
          benchmark::DoNotOptimize(day.solve(part<Part>, version<Version>, input));
        }
      }
    } catch (std::exception const & ex) {
      auto const msg = fmt::format("Exception: {}", ex.what());
      state.SkipWithError(msg.c_str());
    }
  }

  template <size_t Day, size_t Part, bool IsMultiDayBenchmark>
  void register_day_part() {
    using input_t = simd_string_t;
    static constexpr auto versions = version_info_for_part<Day, Part, input_t>;
    auto const name = fmt::format("day {:02} - part {}", Day, Part);

    if constexpr (versions.has_versions && !IsMultiDayBenchmark) {
      // Single day: compare all versions against each other.
      auto const invoker = [&]<size_t... Version>(std::index_sequence<Version...>) {
        (..., benchmark::RegisterBenchmark(fmt::format("{} v{:d}", name, Version).c_str(),
                                           &benchmark_day_part<Day, Part, Version>));
      };
      invoker(std::make_index_sequence<versions.num_versions>{});
    } else if constexpr (versions.has_versions) {
      benchmark::RegisterBenchmark(name.c_str(),
                                   &benchmark_day_part<Day, Part, versions.highest_version()>);
    } else if constexpr (invocable_for_part<Day, Part, input_t>) {
      benchmark::RegisterBenchmark(name.c_str(), &benchmark_day_part<Day, Part>);
    }
  }

  template <size_t Day, bool IsMultiDayBenchmark>
  void register_day() {
    auto const invoker = []<size_t... Part>(std::index_sequence<Part...>) {
      (..., register_day_part<Day, Part + 1, IsMultiDayBenchmark>());
    };
    invoker(std::make_index_sequence<max_parts>{});
  }

  template <size_t... Days>
  void register_days() {
    static constexpr bool is_multi_day_benchmark = sizeof...(Days) > 1;
    (..., register_day<Days, is_multi_day_benchmark>());
  }

}  // namespace

int main(int argc, char ** argv) {
  yule::setup_logging(argc, argv);

  benchmark::Initialize(&argc, argv);
  register_days<DAY_NUMBERS>();
  benchmark::RunSpecifiedBenchmarks();
  benchmark::Shutdown();

  return 0;
}
