/**
 * @file output_manifest.h
 * @brief Description of the files produced for one request
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace phonegen::output {

/**
 * @brief One output file
 */
struct ManifestEntry {
  size_t ordinal = 0;  // 1-based
  std::string filename;
  uint64_t byte_size = 0;
  uint64_t line_count = 0;
};

/**
 * @brief Ordered list of output files
 *
 * Concatenating the files in ordinal order yields every generated number
 * exactly once, in enumeration order.
 */
struct OutputManifest {
  std::string directory;
  std::vector<ManifestEntry> entries;
  uint64_t total_lines_written = 0;

  [[nodiscard]] bool empty() const { return entries.empty(); }

  [[nodiscard]] uint64_t TotalBytes() const;

  /**
   * @brief JSON array of files: {ordinal, name, bytes, size, lines}
   *
   * "size" is the human-readable form of "bytes".
   */
  [[nodiscard]] nlohmann::json ToJson() const;
};

}  // namespace phonegen::output
