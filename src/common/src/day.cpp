#include "yule/day.hpp"

#include "yule/file.hpp"
#include "yule/string.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <regex>
#include <string>

namespace yule {

  namespace {

    constexpr std::string_view example_marker = "-example_";
    constexpr std::string_view solution_suffix = "-solution";

  }  // namespace

  std::filesystem::path input_file_path(std::filesystem::path dir, size_t day, size_t part) {
    return std::move(dir) / fmt::format("day_{:02d}-part_{}.txt", day, part);
  }

  std::filesystem::path solution_file_path(std::filesystem::path const & example_file) {
    auto name = example_file.stem();
    name += std::string{solution_suffix};
    name += example_file.extension();
    return example_file.parent_path() / name;
  }

  size_t example_number(std::filesystem::path const & example_file) {
    auto const stem = example_file.stem().string();
    auto const marker = stem.rfind(example_marker);
    if (marker == std::string::npos) {
      throw parse_error(fmt::format("Not an example file name ({})", stem));
    }
    return to_int<size_t>(std::string_view{stem}.substr(marker + example_marker.size()));
  }

  std::vector<std::filesystem::path> example_file_paths(std::filesystem::path const & dir,
                                                        size_t day,
                                                        size_t part) {
    std::vector<std::filesystem::path> result;
    if (!std::filesystem::is_directory(dir)) {
      return result;
    }

    auto const pattern =
        std::regex(fmt::format(R"(^day_{:02d}-part_{:d}-example_\d+\.txt$)", day, part));

    for (auto const & entry : std::filesystem::directory_iterator{dir}) {
      auto const & path = entry.path();
      if (!std::filesystem::is_regular_file(resolve_symlink(path))) {
        continue;
      }

      auto const filename = path.filename().string();
      if (!std::regex_match(filename, pattern)) {
        continue;
      }

      if (std::filesystem::exists(solution_file_path(path))) {
        result.push_back(path);
      }
    }

    // Sort by example number, so example_10 comes after example_9.
    std::ranges::sort(result, {}, [](auto const & path) { return example_number(path); });
    return result;
  }

}  // namespace yule
