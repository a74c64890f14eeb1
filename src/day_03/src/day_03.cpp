#include "yule/day_03.hpp"

#include "yule/string.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <string_view>

namespace yule {

  namespace {

    // 20 digits would overflow for some banks, 19 never does.
    constexpr unsigned max_batteries = 19;

    void validate_bank(std::string_view bank, unsigned num_batteries) {
      assert(num_batteries > 0 && num_batteries <= max_batteries);

      if (bank.size() < num_batteries) {
        throw parse_error(fmt::format("Bank '{}' has fewer than {} batteries", bank,
                                      num_batteries));
      }

      auto const non_digit = std::ranges::find_if(bank, [](char c) { return c < '0' || c > '9'; });
      if (non_digit != bank.end()) {
        throw parse_error(fmt::format("Bank '{}' contains non-digit '{}'", bank, *non_digit));
      }
    }

    template <size_t Version>
    uint64_t total_joltage(simd_string_view_t input, unsigned num_batteries) {
      uint64_t total = 0;

      for (auto const & line : split(input, '\n')) {
        auto const bank = as_string_view(line);
        if (bank.empty()) {
          continue;
        }

        uint64_t const joltage = max_joltage(version<Version>, bank, num_batteries);
        SPDLOG_DEBUG("Bank {} can produce {}", bank, joltage);
        total += joltage;
      }

      return total;
    }

  }  // namespace

  /* The first digit has to leave room for the remaining ones, so it can only come from the first
   * size - (N - 1) entries. Taking the first occurrence of the largest digit in that window is
   * always optimal: it leaves the most entries for the rest. Every next digit searches from just
   * past the previous pick, with a window that is one entry longer.
   */
  uint64_t max_joltage(version_t<0>, std::string_view bank, unsigned num_batteries) {
    validate_bank(bank, num_batteries);

    uint64_t result = 0;
    size_t window_begin = 0;
    size_t window_end = bank.size() - (num_batteries - 1);

    for (unsigned digit = 0; digit < num_batteries; ++digit, ++window_end) {
      // max_element returns the first maximum.
      auto const window = bank.substr(window_begin, window_end - window_begin);
      auto const best = std::ranges::max_element(window);
      size_t const best_pos = window_begin + std::distance(window.begin(), best);

      result = result * 10 + static_cast<uint64_t>(*best - '0');
      window_begin = best_pos + 1;
    }

    return result;
  }

  /* Single pass: keep a stack of picked digits. A new digit pops smaller digits off the stack as
   * long as enough digits remain to still fill all N slots.
   */
  uint64_t max_joltage(version_t<1>, std::string_view bank, unsigned num_batteries) {
    validate_bank(bank, num_batteries);

    std::array<char, max_batteries> picked{};
    size_t num_picked = 0;
    size_t droppable = bank.size() - num_batteries;

    for (char const c : bank) {
      while (num_picked > 0 && droppable > 0 && picked[num_picked - 1] < c) {
        --num_picked;
        --droppable;
      }

      if (num_picked < num_batteries) {
        picked[num_picked++] = c;
      } else {
        --droppable;  // Stack is full, so this digit is dropped.
      }
    }

    assert(num_picked == num_batteries);

    uint64_t result = 0;
    for (size_t idx = 0; idx < num_picked; ++idx) {
      result = result * 10 + static_cast<uint64_t>(picked[idx] - '0');
    }

    return result;
  }

  uint64_t day_t<3>::solve(part_t<1>, version_t<0>, simd_string_view_t input) {
    return total_joltage<0>(input, 2);
  }

  uint64_t day_t<3>::solve(part_t<1>, version_t<1>, simd_string_view_t input) {
    return total_joltage<1>(input, 2);
  }

  uint64_t day_t<3>::solve(part_t<2>, version_t<0>, simd_string_view_t input) {
    return total_joltage<0>(input, 12);
  }

  uint64_t day_t<3>::solve(part_t<2>, version_t<1>, simd_string_view_t input) {
    return total_joltage<1>(input, 12);
  }

}  // namespace yule
