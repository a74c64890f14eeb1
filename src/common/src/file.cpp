#include "yule/file.hpp"

#include "yule/string.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <string>

namespace yule {

  simd_string_t read_file(std::filesystem::path const & file) {
    auto ifile = std::ifstream{file, std::ios::binary};
    if (!ifile.is_open()) {
      throw file_read_error(fmt::format("Failed to open file ({})", file));
    }

    auto const raw =
        std::string(std::istreambuf_iterator<char>{ifile}, std::istreambuf_iterator<char>{});
    if (ifile.bad()) {
      throw file_read_error(fmt::format("Failed to read file ({})", file));
    }

    // Always end on a newline, so parsers never need to check for both '\n' and EOF.
    auto result = to_simd_string(trim(std::string_view{raw}));
    result.push_back('\n');

    SPDLOG_DEBUG("Read {} bytes from {}", result.size(), file);
    return result;
  }

  std::filesystem::path resolve_symlink(std::filesystem::path path) {
    while (std::filesystem::is_symlink(path)) {
      auto target = std::filesystem::read_symlink(path);
      if (target.is_absolute()) {
        path = std::move(target);
      } else {
        path = (path.parent_path() / target).lexically_normal();
      }
    }

    return path;
  }

}  // namespace yule
