#pragma once

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace yule {

  /// Exception type thrown by the `check` function.
  struct check_failure : public std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /// Logs an error and throws `check_failure` if `condition` is false.
  template <class... Args>
  void check(bool condition, fmt::format_string<Args...> fmt, Args &&... args) {
    if (!condition) [[unlikely]] {
      auto msg = fmt::format(std::move(fmt), std::forward<Args>(args)...);
      spdlog::error(msg);
      throw check_failure(std::move(msg));
    }
  }

}  // namespace yule
