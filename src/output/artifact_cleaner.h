/**
 * @file artifact_cleaner.h
 * @brief Removal of expired output files
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::output {

/**
 * @brief Deletes output files older than the retention period
 *
 * Only performs a single sweep; running it periodically is up to the caller.
 */
class ArtifactCleaner {
 public:
  ArtifactCleaner(std::string output_dir, uint32_t expire_hours);

  /**
   * @brief Delete regular files whose modification time is older than expire_hours
   *
   * @return Number of files removed (0 if the directory does not exist), or
   *         kOutputDirectoryError if the directory cannot be listed
   */
  [[nodiscard]] utils::Expected<size_t, utils::Error> CleanupExpired() const;

 private:
  std::string output_dir_;
  uint32_t expire_hours_;
};

}  // namespace phonegen::output
