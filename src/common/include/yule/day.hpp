#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <type_traits>
#include <vector>

namespace yule {

  /// @brief A day's solutions. Must be specialized for each day.
  template <size_t N>
  struct day_t;

  /// @brief Part tag for dispatching to the implementation of a part.
  template <size_t N>
  struct part_t : std::integral_constant<size_t, N> {};

  template <size_t N>
  inline constexpr part_t<N> part{};

  /// @brief Version tag for dispatching between alternative implementations of the same part.
  template <size_t N>
  struct version_t : std::integral_constant<size_t, N> {};

  template <size_t N>
  inline constexpr version_t<N> version{};

  /// Highest number of parts any day has.
  inline constexpr size_t max_parts = 2;

  /// @brief Returns the path to the puzzle input of a day and part.
  std::filesystem::path input_file_path(std::filesystem::path dir, size_t day, size_t part);

  /** @brief Returns all example inputs of a day and part that come with a solution file, sorted.
   *
   * Examples are named `day_DD-part_P-example_K.txt`, their solutions
   * `day_DD-part_P-example_K-solution.txt`. Both may be symlinks.
   */
  std::vector<std::filesystem::path> example_file_paths(std::filesystem::path const & dir,
                                                        size_t day,
                                                        size_t part);

  /// @brief Returns the solution file belonging to an example file.
  std::filesystem::path solution_file_path(std::filesystem::path const & example_file);

  /// @brief Returns K for an example file named `...-example_K.txt`.
  size_t example_number(std::filesystem::path const & example_file);

  // Whether a day solves a part without, or with a given, version tag.
  template <size_t Day, size_t Part, class Input>
  concept invocable_for_part = requires(day_t<Day> t, Input in) {
    { t.solve(part<Part>, in) };
  };

  template <size_t Day, size_t Part, size_t Version, class Input>
  concept invocable_for_part_version = requires(day_t<Day> t, Input in) {
    { t.solve(part<Part>, version<Version>, in) };
  };

  struct version_info_t {
    bool has_versions;
    size_t num_versions;

    constexpr size_t highest_version() const { return num_versions - 1; }
  };

  namespace detail {

    template <size_t Day, size_t Part, class Input, size_t Version = 0>
    constexpr size_t count_versions() {
      if constexpr (invocable_for_part_version<Day, Part, Version, Input>) {
        return count_versions<Day, Part, Input, Version + 1>();
      } else {
        return Version;
      }
    }

  }  // namespace detail

  /// Versions available to solve a part. Versions are numbered consecutively from zero.
  template <size_t Day, size_t Part, class Input>
  inline constexpr version_info_t version_info_for_part{
      detail::count_versions<Day, Part, Input>() > 0,
      detail::count_versions<Day, Part, Input>(),
  };

  /// Whether a part can be solved at all, with or without versions.
  template <size_t Day, size_t Part, class Input>
  inline constexpr bool can_solve_part =
      version_info_for_part<Day, Part, Input>.has_versions || invocable_for_part<Day, Part, Input>;

}  // namespace yule
