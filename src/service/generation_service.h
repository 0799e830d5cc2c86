/**
 * @file generation_service.h
 * @brief Request facade: resolve, dispatch and write in one call
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config/config.h"
#include "generator/partition_dispatcher.h"
#include "index/lookup_index.h"
#include "output/output_manifest.h"
#include "output/output_writer.h"
#include "plan/constraint_resolver.h"
#include "plan/filter_request.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::service {

/// Response codes of the JSON form
constexpr int kResponseOk = 200;
constexpr int kResponseBadRequest = 400;
constexpr int kResponseInternalError = 500;

/**
 * @brief Generation limits and output location
 */
struct GenerationOptions {
  uint64_t max_count = config::defaults::kMaxCount;
  uint32_t workers = 0;  // 0 = CPU cores
  uint64_t file_size_limit_bytes = config::defaults::kFileSizeLimitBytes;
  std::string output_dir = config::defaults::kOutputDir;
  std::string name_template = config::defaults::kNameTemplate;

  static GenerationOptions FromConfig(const config::Config& config);
};

/**
 * @brief Failure of a generation request
 *
 * computed_count is set when the request was rejected by the ceiling;
 * failed_partition is set when a partition failed.
 */
struct GenerationError {
  utils::Error error;
  std::optional<uint64_t> computed_count;
  std::optional<size_t> failed_partition;

  /**
   * @brief 400 for request errors (validation, ceiling), 500 otherwise
   */
  [[nodiscard]] int ResponseCode() const;

  /**
   * @brief {"code": ..., "message": ..., "data": {"count"?, "partition"?, "error_code"}}
   */
  [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief Successful generation
 */
struct GenerationResult {
  uint64_t count = 0;
  std::string base_name;
  output::OutputManifest manifest;

  /**
   * @brief {"code": 200, "message": ..., "data": {"count": ..., "files": [...]}}
   */
  [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief Generation service
 *
 * Shares one LookupIndex and one worker pool between all requests;
 * Generate() may be called concurrently.
 */
class GenerationService {
 public:
  /**
   * @param index Lookup index (must outlive the service)
   * @param options Limits and output location
   */
  GenerationService(const index::LookupIndex& index, GenerationOptions options);

  ~GenerationService() = default;

  GenerationService(const GenerationService&) = delete;
  GenerationService& operator=(const GenerationService&) = delete;
  GenerationService(GenerationService&&) = delete;
  GenerationService& operator=(GenerationService&&) = delete;

  /**
   * @brief Generate the numbers of a request into output files
   *
   * A request matching no coverage succeeds with count 0 and no files.
   */
  [[nodiscard]] utils::Expected<GenerationResult, GenerationError> Generate(const plan::FilterRequest& request);

  [[nodiscard]] std::vector<std::string> Provinces() const { return index_.Provinces(); }

  [[nodiscard]] std::vector<std::string> Cities(const std::string& province) const {
    return index_.Cities(province);
  }

  [[nodiscard]] const GenerationOptions& GetOptions() const { return options_; }

 private:
  const index::LookupIndex& index_;
  GenerationOptions options_;
  plan::ConstraintResolver resolver_;
  std::unique_ptr<generator::PartitionDispatcher> dispatcher_;
  output::OutputWriter writer_;

  std::mutex names_mutex_;
  std::set<std::string> names_in_use_;

  /**
   * @brief Pick a base name no other request or existing file uses
   */
  std::string ReserveBaseName(const std::string& candidate);
  void ReleaseBaseName(const std::string& name);
};

/**
 * @brief {"code": 200, "message": "ok", "data": [...]} for selection lists
 */
nlohmann::json ListResponse(const std::vector<std::string>& items);

}  // namespace phonegen::service
