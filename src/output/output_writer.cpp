/**
 * @file output_writer.cpp
 * @brief Output writer implementation
 */

#include "output/output_writer.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "utils/constants.h"
#include "utils/structured_log.h"

namespace phonegen::output {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Files written by one Write() call
 *
 * Everything created is removed on destruction unless Commit() succeeded.
 */
class PartFileSet {
 public:
  PartFileSet(std::filesystem::path directory, std::string name_prefix)
      : directory_(std::move(directory)), name_prefix_(std::move(name_prefix)) {}

  ~PartFileSet() {
    if (!committed_) {
      RemoveAll();
    }
  }

  PartFileSet(const PartFileSet&) = delete;
  PartFileSet& operator=(const PartFileSet&) = delete;
  PartFileSet(PartFileSet&&) = delete;
  PartFileSet& operator=(PartFileSet&&) = delete;

  [[nodiscard]] bool HasOpenFile() const { return stream_.is_open(); }
  [[nodiscard]] uint64_t CurrentBytes() const { return entries_.empty() ? 0 : entries_.back().byte_size; }

  utils::Expected<void, utils::Error> OpenNext() {
    ManifestEntry entry;
    entry.ordinal = entries_.size() + 1;
    std::filesystem::path temp_path =
        directory_ / (PartName(entry.ordinal) + OutputWriter::kTempSuffix);

    stream_.open(temp_path, std::ios::binary | std::ios::trunc);
    if (!stream_) {
      utils::LogOutputError("open", temp_path.string(), "cannot create file");
      return MakeUnexpected(MakeError(ErrorCode::kOutputWriteFailed, "Cannot create output file",
                                      temp_path.string()));
    }
    temp_paths_.push_back(temp_path);
    entries_.push_back(entry);
    return {};
  }

  utils::Expected<void, utils::Error> Append(const char* data, size_t size, uint64_t lines) {
    stream_.write(data, static_cast<std::streamsize>(size));
    if (!stream_) {
      utils::LogOutputError("write", temp_paths_.back().string(), "write failed");
      return MakeUnexpected(
          MakeError(ErrorCode::kOutputWriteFailed, "Failed to write output file", temp_paths_.back().string()));
    }
    entries_.back().byte_size += size;
    entries_.back().line_count += lines;
    return {};
  }

  utils::Expected<void, utils::Error> CloseCurrent() {
    stream_.flush();
    const bool flushed = static_cast<bool>(stream_);
    stream_.close();
    if (!flushed || stream_.fail()) {
      utils::LogOutputError("close", temp_paths_.back().string(), "flush failed");
      return MakeUnexpected(
          MakeError(ErrorCode::kOutputWriteFailed, "Failed to flush output file", temp_paths_.back().string()));
    }
    return {};
  }

  /**
   * @brief Rename temporary files to their final names
   */
  utils::Expected<std::vector<ManifestEntry>, utils::Error> Commit() {
    const bool single = entries_.size() == 1;
    for (size_t i = 0; i < entries_.size(); ++i) {
      std::string final_name = single ? name_prefix_ + OutputWriter::kExtension : PartName(entries_[i].ordinal);
      std::filesystem::path final_path = directory_ / final_name;

      std::error_code error_code;
      std::filesystem::rename(temp_paths_[i], final_path, error_code);
      if (error_code) {
        utils::LogOutputError("rename", final_path.string(), error_code.message());
        return MakeUnexpected(MakeError(ErrorCode::kOutputWriteFailed,
                                        "Failed to rename output file: " + error_code.message(),
                                        final_path.string()));
      }
      final_paths_.push_back(final_path);
      entries_[i].filename = final_name;
    }
    committed_ = true;
    return entries_;
  }

 private:
  std::filesystem::path directory_;
  std::string name_prefix_;
  std::ofstream stream_;
  std::vector<ManifestEntry> entries_;
  std::vector<std::filesystem::path> temp_paths_;
  std::vector<std::filesystem::path> final_paths_;
  bool committed_ = false;

  [[nodiscard]] std::string PartName(size_t ordinal) const {
    return name_prefix_ + "_part" + std::to_string(ordinal) + OutputWriter::kExtension;
  }

  void RemoveAll() {
    if (stream_.is_open()) {
      stream_.close();
    }
    std::error_code error_code;
    for (const auto& path : temp_paths_) {
      std::filesystem::remove(path, error_code);
    }
    for (const auto& path : final_paths_) {
      std::filesystem::remove(path, error_code);
    }
    if (!temp_paths_.empty()) {
      utils::StructuredLog()
          .Event("output_rolled_back")
          .Field("directory", directory_.string())
          .Field("files", static_cast<uint64_t>(temp_paths_.size()))
          .Warn();
    }
  }
};

}  // namespace

OutputWriter::OutputWriter(std::string output_dir) : output_dir_(std::move(output_dir)) {}

utils::Expected<void, utils::Error> OutputWriter::CheckResults(
    const plan::EnumerationPlan& plan, const std::vector<generator::PartitionResult>& results) {
  uint64_t expected_start = 0;
  for (size_t i = 0; i < results.size(); ++i) {
    const auto& result = results[i];
    if (result.ordinal != i) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                      "Partition results out of order at position " + std::to_string(i)));
    }
    if (result.start_offset != expected_start || result.end_offset < result.start_offset) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                      "Partition " + std::to_string(i) + " is not contiguous with its predecessor"));
    }
    if (result.line_count != result.end_offset - result.start_offset ||
        result.lines.size() != result.line_count * constants::kLineBytes) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                      "Partition " + std::to_string(i) + " does not hold its full range"));
    }
    expected_start = result.end_offset;
  }
  if (expected_start != plan.total_count) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "Partitions cover " + std::to_string(expected_start) + " of " +
                                        std::to_string(plan.total_count) + " numbers"));
  }
  return {};
}

utils::Expected<OutputManifest, utils::Error> OutputWriter::Write(
    const plan::EnumerationPlan& plan, const std::vector<generator::PartitionResult>& results,
    uint64_t threshold_bytes, const std::string& name_prefix) const {
  if (threshold_bytes == 0) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "File size threshold must be positive"));
  }
  if (name_prefix.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Output name prefix is empty"));
  }
  auto checked = CheckResults(plan, results);
  if (!checked) {
    return MakeUnexpected(checked.error());
  }

  OutputManifest manifest;
  manifest.directory = output_dir_;
  if (plan.total_count == 0) {
    return manifest;
  }

  std::error_code error_code;
  std::filesystem::create_directories(output_dir_, error_code);
  if (error_code) {
    utils::LogOutputError("create_directories", output_dir_, error_code.message());
    return MakeUnexpected(MakeError(ErrorCode::kOutputDirectoryError,
                                    "Cannot create output directory: " + error_code.message(), output_dir_));
  }

  PartFileSet files(output_dir_, name_prefix);

  // Every line has the same width, so the number of lines that still fit
  // into the current file follows from its size alone
  const uint64_t line_bytes = constants::kLineBytes;
  for (const auto& result : results) {
    const char* data = result.lines.data();
    uint64_t lines_left = result.line_count;

    while (lines_left > 0) {
      if (!files.HasOpenFile()) {
        auto opened = files.OpenNext();
        if (!opened) {
          return MakeUnexpected(opened.error());
        }
      }

      const uint64_t used = files.CurrentBytes();
      uint64_t fit = used < threshold_bytes ? (threshold_bytes - used) / line_bytes : 0;
      if (fit == 0) {
        if (used > 0) {
          auto closed = files.CloseCurrent();
          if (!closed) {
            return MakeUnexpected(closed.error());
          }
          continue;
        }
        // threshold smaller than one line: one line per file
        fit = 1;
      }

      const uint64_t chunk = std::min(fit, lines_left);
      auto appended = files.Append(data, static_cast<size_t>(chunk * line_bytes), chunk);
      if (!appended) {
        return MakeUnexpected(appended.error());
      }
      data += chunk * line_bytes;
      lines_left -= chunk;
    }
  }

  if (files.HasOpenFile()) {
    auto closed = files.CloseCurrent();
    if (!closed) {
      return MakeUnexpected(closed.error());
    }
  }

  auto committed = files.Commit();
  if (!committed) {
    return MakeUnexpected(committed.error());
  }
  manifest.entries = std::move(*committed);
  for (const auto& entry : manifest.entries) {
    manifest.total_lines_written += entry.line_count;
  }

  utils::StructuredLog()
      .Event("output_written")
      .Field("directory", output_dir_)
      .Field("files", static_cast<uint64_t>(manifest.entries.size()))
      .Field("lines", manifest.total_lines_written)
      .Field("bytes", manifest.TotalBytes())
      .Info();

  return manifest;
}

}  // namespace phonegen::output
