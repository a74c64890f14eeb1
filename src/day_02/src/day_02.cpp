#include "yule/day_02.hpp"

#include "yule/math.hpp"
#include "yule/simd.hpp"
#include "yule/string.hpp"

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <string_view>

namespace yule {

  namespace {

    // Number of IDs per unit of parallel work. Small enough that a few huge ranges still spread
    // over all threads, large enough that scheduling overhead doesn't show.
    constexpr uint64_t ids_per_chunk = uint64_t{1} << 14;

    id_range_t parse_id_range(std::string_view text) {
      auto const dash = text.find('-');
      if (dash == text.npos) {
        throw parse_error(fmt::format("Invalid range '{}': expected <first>-<last>", text));
      }

      try {
        return id_range_t{
            .first = to_int<uint64_t>(text.substr(0, dash)),
            .last = to_int<uint64_t>(text.substr(dash + 1)),
        };
      } catch (parse_error const & ex) {
        throw parse_error(fmt::format("Invalid range '{}': {}", text, ex.what()));
      }
    }

    /* Checks whether `id` is made of `num_blocks` identical blocks of `block_width` digits each.
     * The caller guarantees that `id` has exactly `num_blocks * block_width` digits, so the most
     * significant block never has leading zeros.
     */
    bool is_repeated_block(uint64_t id, unsigned block_width, unsigned num_blocks) {
      assert(num_blocks >= 2);

      uint64_t const pivot = power_of_10(block_width);
      uint64_t const block = id % pivot;

      for (unsigned i = 1; i < num_blocks; ++i) {
        id /= pivot;
        if (id % pivot != block) {
          return false;
        }
      }

      return true;
    }

    /// Cuts ranges into pieces of at most ids_per_chunk IDs. Empty ranges are dropped.
    simd_vector_t<id_range_t> split_into_chunks(std::span<id_range_t const> ranges) {
      simd_vector_t<id_range_t> chunks;

      for (auto const & range : ranges) {
        if (range.first > range.last) {
          continue;
        }

        uint64_t first = range.first;
        while (true) {
          // Compare remaining length instead of computing first + ids_per_chunk, which could wrap
          // around for ranges near the top of the 64-bit domain.
          bool const is_tail = (range.last - first) < ids_per_chunk;
          uint64_t const last = is_tail ? range.last : first + (ids_per_chunk - 1);
          chunks.push_back({.first = first, .last = last});

          if (is_tail) {
            break;
          }
          first = last + 1;
        }
      }

      SPDLOG_DEBUG("Split {} ranges into {} chunks", ranges.size(), chunks.size());
      return chunks;
    }

    invalid_tally_t solve_sequential(simd_string_view_t input, repeat_mode_t mode) {
      auto const ranges = parse_id_ranges(input);
      SPDLOG_DEBUG("Parsed {} ranges, mode: {}", ranges.size(), repeat_mode_name(mode));
      return tally_invalid_ids(ranges, mode);
    }

    invalid_tally_t solve_parallel(simd_string_view_t input, repeat_mode_t mode) {
      auto const ranges = parse_id_ranges(input);
      SPDLOG_DEBUG("Parsed {} ranges, mode: {}", ranges.size(), repeat_mode_name(mode));
      return tally_invalid_ids_parallel(ranges, mode);
    }

  }  // namespace

  repeat_mode_t parse_repeat_mode(std::string_view name) {
    auto const mode = magic_enum::enum_cast<repeat_mode_t>(name);
    if (!mode.has_value()) {
      spdlog::warn("Unknown mode '{}', using '{}'", name, repeat_mode_name(repeat_mode_t::two));
      return repeat_mode_t::two;
    }
    return *mode;
  }

  std::string_view repeat_mode_name(repeat_mode_t mode) {
    return magic_enum::enum_name(mode);
  }

  simd_vector_t<id_range_t> parse_id_ranges(simd_string_view_t input) {
    simd_vector_t<id_range_t> result;

    if (trim(as_string_view(input)).empty()) {
      return result;
    }

    auto const entries = split(input, ',');
    result.reserve(entries.size());

    for (auto const & entry : entries) {
      auto const range = parse_id_range(trim(as_string_view(entry)));
      SPDLOG_TRACE("Parsed range {}", range);
      result.push_back(range);
    }

    return result;
  }

  bool is_valid_id(uint64_t id, repeat_mode_t mode) {
    unsigned const digits = num_digits(id);
    unsigned const max_blocks = (mode == repeat_mode_t::two) ? 2 : digits;

    for (unsigned num_blocks = 2; num_blocks <= max_blocks; ++num_blocks) {
      if (digits % num_blocks != 0) {  // Blocks must fit evenly.
        continue;
      }

      if (is_repeated_block(id, digits / num_blocks, num_blocks)) {
        SPDLOG_TRACE("ID {} is {} blocks of {} digits", id, num_blocks, digits / num_blocks);
        return false;
      }
    }

    return true;
  }

  invalid_tally_t tally_invalid_ids(id_range_t const & range, repeat_mode_t mode) {
    invalid_tally_t tally;

    if (range.first > range.last) {
      return tally;
    }

    // Loop on equality with the last ID instead of `id <= last`, which would never end for a
    // range that ends at the largest 64-bit value.
    for (uint64_t id = range.first;; ++id) {
      bool const is_invalid = !is_valid_id(id, mode);
      tally.count += is_invalid;
      tally.sum += is_invalid ? id : 0;

      if (id == range.last) {
        break;
      }
    }

    return tally;
  }

  invalid_tally_t tally_invalid_ids(std::span<id_range_t const> ranges, repeat_mode_t mode) {
    invalid_tally_t total;

    for (auto const & range : ranges) {
      auto const tally = tally_invalid_ids(range, mode);
      SPDLOG_DEBUG("Range {} has {} invalid IDs (sum: {})", range, tally.count, tally.sum);
      total += tally;
    }

    return total;
  }

  invalid_tally_t tally_invalid_ids_parallel(std::span<id_range_t const> ranges,
                                             repeat_mode_t mode) {
    auto const chunks = split_into_chunks(ranges);
    size_t const num_chunks = chunks.size();

    uint64_t count = 0;
    uint64_t sum = 0;

    // Chunks are independent, each thread accumulates privately and OpenMP adds them up.
#pragma omp parallel for reduction(+ : count, sum) schedule(dynamic)
    for (size_t chunk_idx = 0; chunk_idx < num_chunks; ++chunk_idx) {
      auto const tally = tally_invalid_ids(chunks[chunk_idx], mode);
      count += tally.count;
      sum += tally.sum;
    }

    SPDLOG_DEBUG("{} chunks have {} invalid IDs (sum: {})", num_chunks, count, sum);
    return {.count = count, .sum = sum};
  }

  invalid_tally_t day_t<2>::solve(part_t<1>, version_t<0>, simd_string_view_t input) {
    return solve_sequential(input, repeat_mode_t::two);
  }

  invalid_tally_t day_t<2>::solve(part_t<1>, version_t<1>, simd_string_view_t input) {
    return solve_parallel(input, repeat_mode_t::two);
  }

  invalid_tally_t day_t<2>::solve(part_t<2>, version_t<0>, simd_string_view_t input) {
    return solve_sequential(input, repeat_mode_t::multiple);
  }

  invalid_tally_t day_t<2>::solve(part_t<2>, version_t<1>, simd_string_view_t input) {
    return solve_parallel(input, repeat_mode_t::multiple);
  }

}  // namespace yule
