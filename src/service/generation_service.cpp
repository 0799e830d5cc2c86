/**
 * @file generation_service.cpp
 * @brief Generation service implementation
 */

#include "service/generation_service.h"

#include <chrono>
#include <filesystem>
#include <utility>

#include "output/artifact_naming.h"
#include "utils/scope_guard.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace phonegen::service {

using utils::ErrorCode;
using utils::MakeUnexpected;

namespace {

GenerationError FromError(utils::Error error) {
  GenerationError result;
  result.error = std::move(error);
  return result;
}

}  // namespace

GenerationOptions GenerationOptions::FromConfig(const config::Config& config) {
  GenerationOptions options;
  options.max_count = config.generator.max_count;
  options.workers = config.generator.workers;
  options.file_size_limit_bytes = config.generator.file_size_limit_bytes;
  options.output_dir = config.output.dir;
  options.name_template = config.generator.name_template;
  return options;
}

int GenerationError::ResponseCode() const {
  switch (error.code()) {
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kPlanValidationError:
    case ErrorCode::kPlanLimitExceeded:
      return kResponseBadRequest;
    default:
      return kResponseInternalError;
  }
}

nlohmann::json GenerationError::ToJson() const {
  nlohmann::json data = nlohmann::json::object();
  data["error_code"] = static_cast<int32_t>(error.code());
  if (computed_count.has_value()) {
    data["count"] = *computed_count;
  }
  if (failed_partition.has_value()) {
    data["partition"] = *failed_partition;
  }

  nlohmann::json response;
  response["code"] = ResponseCode();
  response["message"] = error.message();
  response["data"] = std::move(data);
  return response;
}

nlohmann::json GenerationResult::ToJson() const {
  nlohmann::json data;
  data["count"] = count;
  data["files"] = manifest.ToJson();

  nlohmann::json response;
  response["code"] = kResponseOk;
  response["message"] = count == 0 ? "No numbers match the request" : "Generated";
  response["data"] = std::move(data);
  return response;
}

nlohmann::json ListResponse(const std::vector<std::string>& items) {
  nlohmann::json response;
  response["code"] = kResponseOk;
  response["message"] = "ok";
  response["data"] = items;
  return response;
}

GenerationService::GenerationService(const index::LookupIndex& index, GenerationOptions options)
    : index_(index),
      options_(std::move(options)),
      resolver_(index_, options_.max_count),
      dispatcher_(std::make_unique<generator::PartitionDispatcher>(options_.workers)),
      writer_(options_.output_dir) {}

std::string GenerationService::ReserveBaseName(const std::string& candidate) {
  std::scoped_lock lock(names_mutex_);
  const std::filesystem::path dir(options_.output_dir);

  std::string name = candidate;
  for (int attempt = 2;; ++attempt) {
    std::error_code error_code;
    bool taken = names_in_use_.count(name) > 0 ||
                 std::filesystem::exists(dir / (name + output::OutputWriter::kExtension), error_code) ||
                 std::filesystem::exists(dir / (name + "_part1" + output::OutputWriter::kExtension), error_code);
    if (!taken) {
      break;
    }
    name = candidate + "_" + std::to_string(attempt);
  }
  names_in_use_.insert(name);
  return name;
}

void GenerationService::ReleaseBaseName(const std::string& name) {
  std::scoped_lock lock(names_mutex_);
  names_in_use_.erase(name);
}

utils::Expected<GenerationResult, GenerationError> GenerationService::Generate(const plan::FilterRequest& request) {
  const auto start_time = std::chrono::steady_clock::now();

  auto plan = resolver_.Validate(request);
  if (!plan) {
    GenerationError error = FromError(plan.error().error);
    if (plan.error().error.code() == ErrorCode::kPlanLimitExceeded) {
      error.computed_count = plan.error().computed_count;
    }
    return MakeUnexpected(std::move(error));
  }

  GenerationResult result;
  result.count = plan->total_count;
  if (plan->total_count == 0) {
    result.manifest.directory = options_.output_dir;
    utils::StructuredLog()
        .Event("generation_empty")
        .Field("prefix", plan->prefix)
        .Field("province", utils::Trim(request.province))
        .Field("city", utils::Trim(request.city))
        .Info();
    return result;
  }

  auto partitions = dispatcher_->Run(*plan, options_.workers);
  if (!partitions) {
    GenerationError error = FromError(partitions.error().error);
    error.failed_partition = partitions.error().partition_index;
    return MakeUnexpected(std::move(error));
  }

  const std::string base_name = ReserveBaseName(
      output::BuildArtifactBaseName(request, std::chrono::system_clock::now(), options_.name_template));
  utils::ScopeGuard release_guard([this, base_name]() { ReleaseBaseName(base_name); });
  result.base_name = base_name;

  auto manifest = writer_.Write(*plan, *partitions, options_.file_size_limit_bytes, result.base_name);
  if (!manifest) {
    return MakeUnexpected(FromError(manifest.error()));
  }
  result.manifest = std::move(*manifest);

  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
  utils::StructuredLog()
      .Event("generation_completed")
      .Field("name", result.base_name)
      .Field("count", result.count)
      .Field("files", static_cast<uint64_t>(result.manifest.entries.size()))
      .Field("elapsed_ms", static_cast<int64_t>(elapsed_ms))
      .Info();

  return result;
}

}  // namespace phonegen::service
