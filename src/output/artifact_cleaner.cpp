/**
 * @file artifact_cleaner.cpp
 * @brief Expired output file sweep
 */

#include "output/artifact_cleaner.h"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

#include "utils/constants.h"
#include "utils/structured_log.h"

namespace phonegen::output {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

ArtifactCleaner::ArtifactCleaner(std::string output_dir, uint32_t expire_hours)
    : output_dir_(std::move(output_dir)), expire_hours_(expire_hours) {}

utils::Expected<size_t, utils::Error> ArtifactCleaner::CleanupExpired() const {
  std::error_code error_code;
  if (!std::filesystem::exists(output_dir_, error_code)) {
    return static_cast<size_t>(0);
  }

  std::filesystem::directory_iterator iter(output_dir_, error_code);
  if (error_code) {
    utils::LogOutputError("list", output_dir_, error_code.message());
    return MakeUnexpected(MakeError(ErrorCode::kOutputDirectoryError,
                                    "Cannot list output directory: " + error_code.message(), output_dir_));
  }

  const auto now = std::filesystem::file_time_type::clock::now();
  const auto max_age = std::chrono::seconds(static_cast<int64_t>(expire_hours_) * constants::kSecondsPerHour);

  size_t removed = 0;
  size_t failed = 0;
  const std::filesystem::directory_iterator end;
  for (; iter != end; iter.increment(error_code)) {
    const auto& entry = *iter;
    std::error_code entry_error;
    if (!entry.is_regular_file(entry_error)) {
      continue;
    }
    auto modified = std::filesystem::last_write_time(entry.path(), entry_error);
    if (entry_error || now - modified <= max_age) {
      continue;
    }
    if (std::filesystem::remove(entry.path(), entry_error)) {
      ++removed;
    } else if (entry_error) {
      ++failed;
      utils::LogOutputError("remove", entry.path().string(), entry_error.message());
    }
  }
  if (error_code) {
    utils::LogOutputError("list", output_dir_, error_code.message());
    return MakeUnexpected(MakeError(ErrorCode::kOutputDirectoryError,
                                    "Cannot list output directory: " + error_code.message(), output_dir_));
  }

  utils::StructuredLog()
      .Event("artifact_cleanup")
      .Field("directory", output_dir_)
      .Field("removed", static_cast<uint64_t>(removed))
      .Field("failed", static_cast<uint64_t>(failed))
      .Field("expire_hours", static_cast<uint64_t>(expire_hours_))
      .Info();

  return removed;
}

}  // namespace phonegen::output
