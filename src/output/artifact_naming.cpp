/**
 * @file artifact_naming.cpp
 * @brief Output file naming
 */

#include "output/artifact_naming.h"

#include <ctime>

#include "utils/string_utils.h"

namespace phonegen::output {

namespace {

constexpr size_t kTimestampBufferSize = 32;

void ReplaceAll(std::string& text, const std::string& placeholder, const std::string& value) {
  size_t pos = 0;
  while ((pos = text.find(placeholder, pos)) != std::string::npos) {
    text.replace(pos, placeholder.size(), value);
    pos += value.size();
  }
}

std::string SuffixLabel(const plan::FilterRequest& request) {
  if (request.trailing_fixed4.has_value()) {
    std::string digits = utils::Trim(*request.trailing_fixed4);
    if (!digits.empty()) {
      return digits;
    }
  }
  if (request.trailing_fixed3.has_value()) {
    std::string digits = utils::Trim(*request.trailing_fixed3);
    if (!digits.empty()) {
      return digits;
    }
  }
  return kAllSuffixLabel;
}

}  // namespace

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
  std::time_t time_value = std::chrono::system_clock::to_time_t(time);
  std::tm local_time{};
  localtime_r(&time_value, &local_time);

  char buffer[kTimestampBufferSize];
  size_t length = std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local_time);
  return std::string(buffer, length);
}

std::string BuildArtifactBaseName(const plan::FilterRequest& request, std::chrono::system_clock::time_point now,
                                  const std::string& name_template) {
  std::string name = name_template;
  ReplaceAll(name, "{prefix}", utils::SanitizeFileNameComponent(utils::Trim(request.prefix)));
  ReplaceAll(name, "{province}", utils::SanitizeFileNameComponent(utils::Trim(request.province)));
  ReplaceAll(name, "{city}", utils::SanitizeFileNameComponent(utils::Trim(request.city)));
  ReplaceAll(name, "{suffix}", SuffixLabel(request));
  ReplaceAll(name, "{timestamp}", FormatTimestamp(now));
  return name;
}

}  // namespace phonegen::output
