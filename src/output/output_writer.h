/**
 * @file output_writer.h
 * @brief Writes partition results to size-capped, ordinal-numbered files
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "generator/partition_dispatcher.h"
#include "output/output_manifest.h"
#include "plan/enumeration_plan.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::output {

/**
 * @brief Output file writer
 *
 * Files appear under their final names only once they are complete: each
 * one is written as "<final>.tmp" and renamed after the last line. A single
 * output file is named "<name_prefix>.txt"; when the threshold forces more
 * than one, they are named "<name_prefix>_part<N>.txt" with N from 1.
 */
class OutputWriter {
 public:
  static constexpr const char* kExtension = ".txt";
  static constexpr const char* kTempSuffix = ".tmp";

  /**
   * @param output_dir Directory receiving the files (created on demand)
   */
  explicit OutputWriter(std::string output_dir);

  /**
   * @brief Write all partitions in ordinal order
   *
   * A file is closed before a line that would take it past
   * threshold_bytes, unless the file is still empty; lines are never split.
   *
   * @param plan Plan the results were generated from
   * @param results Partition results ordered by ordinal
   * @param threshold_bytes Maximum file size in bytes (> 0)
   * @param name_prefix Base file name without extension
   * @return Manifest (empty when plan.total_count is 0), or an error after
   *         every file of this call has been removed
   */
  [[nodiscard]] utils::Expected<OutputManifest, utils::Error> Write(
      const plan::EnumerationPlan& plan, const std::vector<generator::PartitionResult>& results,
      uint64_t threshold_bytes, const std::string& name_prefix) const;

  [[nodiscard]] const std::string& GetOutputDir() const { return output_dir_; }

 private:
  std::string output_dir_;

  static utils::Expected<void, utils::Error> CheckResults(const plan::EnumerationPlan& plan,
                                                          const std::vector<generator::PartitionResult>& results);
};

}  // namespace phonegen::output
