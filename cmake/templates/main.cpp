#include "yule/runner_days.hpp"

#include "yule/day.hpp"
#include "yule/file.hpp"
#include "yule/logging.hpp"
#include "yule/string.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <string_view>
#include <utility>
#include <vector>

namespace {

  using namespace yule;

  template <size_t Day, size_t Part>
  void run_day_part() {
    using input_t = simd_string_t;

    if constexpr (can_solve_part<Day, Part, input_t>) {
      static constexpr auto versions = version_info_for_part<Day, Part, input_t>;
      auto const msg_prefix = fmt::format("[day {:02} - part {}]", Day, Part);

      auto const input_path = input_file_path(input_dir, Day, Part);
      if (!std::filesystem::exists(input_path)) {  // Skip part if file doesn't exist.
        spdlog::error("{} Input file does not exist ({})", msg_prefix, input_path);
        return;
      }

      auto const input = read_file(input_path);
      day_t<Day> day{};

      auto const result = [&] {  // Only run the newest version.
        if constexpr (versions.has_versions) {
          return day.solve(part<Part>, version<versions.highest_version()>, input);
        } else {
          return day.solve(part<Part>, input);
        }
      }();
      spdlog::info("{} {}", msg_prefix, result);
    }
  }

  template <size_t Day>
  void run_day() {
    auto const invoker = []<size_t... Part>(std::index_sequence<Part...>) {
      (..., run_day_part<Day, Part + 1>());
    };
    invoker(std::make_index_sequence<max_parts>{});
  }

  template <size_t... Days>
  void run_days(std::vector<size_t> const & selected) {
    auto const is_selected = [&](size_t day) {
      return selected.empty() || std::ranges::find(selected, day) != selected.end();
    };

    auto const run_if_selected = [&]<size_t Day>(std::integral_constant<size_t, Day>) {
      if (is_selected(Day)) {
        run_day<Day>();
      }
    };
    (..., run_if_selected(std::integral_constant<size_t, Days>{}));
  }

  /// Day numbers on the command line restrict which days run. SPDLOG_LEVEL=... is for spdlog.
  std::vector<size_t> selected_days(int argc, char ** argv) {
    std::vector<size_t> result;

    for (int idx = 1; idx < argc; ++idx) {
      std::string_view const arg = argv[idx];
      if (arg.starts_with("SPDLOG_LEVEL=")) {
        continue;
      }
      result.push_back(to_int<size_t>(arg));
    }

    return result;
  }

}  // namespace

int main(int argc, char ** argv) {
  yule::setup_logging(argc, argv);

  try {
    run_days<DAY_NUMBERS>(selected_days(argc, argv));
  } catch (std::exception const & ex) {
    spdlog::critical("{}", ex.what());
    return 1;
  }

  return 0;
}
