#pragma once

#include "yule/simd.hpp"

#include <filesystem>
#include <stdexcept>

namespace yule {

  struct file_read_error : public std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /** @brief Returns trimmed file contents.
   *
   * @returns Trimmed contents of the file at `file`, followed by a single newline. This simplifies
   * parsing when there's multiple lines. The buffer is aligned to yule::simd_alignment_bytes and
   * padded, see yule::simd_string_t.
   *
   * @throws file_read_error If the file could not be opened or read.
   */
  simd_string_t read_file(std::filesystem::path const & file);

  /// @brief Resolves path to its final target. If path is not a symlink, returns the path itself.
  std::filesystem::path resolve_symlink(std::filesystem::path path);

}  // namespace yule
