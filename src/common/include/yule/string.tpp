#pragma once

#include "yule/string.hpp"  // Only for IDE.

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <utility>

namespace yule {

  template <class StringLike>
    requires requires(StringLike s) {
      { s.substr(0, 1) } -> std::same_as<StringLike>;
    }
  StringLike trim(StringLike s) {
    auto const is_nonspace = [](unsigned char c) { return !std::isspace(c); };

    auto const first = std::ranges::find_if(s, is_nonspace);
    if (first == s.end()) {  // All whitespace (or empty).
      return std::move(s).substr(0, 0);
    }

    // There's at least one non-whitespace character, so this can't hit rend().
    auto const last = std::find_if(s.rbegin(), s.rend(), is_nonspace).base();

    size_t const offset = std::distance(s.begin(), first);
    size_t const length = std::distance(first, last);
    return std::move(s).substr(offset, length);
  }

  template <std::integral T>
  T to_int(std::string_view str) {
    T value{};
    char const * const end = str.data() + str.size();
    auto const [ptr, ec] = std::from_chars(str.data(), end, value);
    if ((ec != std::errc{}) || (ptr != end)) [[unlikely]] {
      throw parse_error(fmt::format("Failed to convert '{}' to integer", str));
    }
    return value;
  }

}  // namespace yule
