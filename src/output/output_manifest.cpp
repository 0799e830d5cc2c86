/**
 * @file output_manifest.cpp
 * @brief Output manifest implementation
 */

#include "output/output_manifest.h"

#include "utils/string_utils.h"

namespace phonegen::output {

uint64_t OutputManifest::TotalBytes() const {
  uint64_t total = 0;
  for (const auto& entry : entries) {
    total += entry.byte_size;
  }
  return total;
}

nlohmann::json OutputManifest::ToJson() const {
  nlohmann::json files = nlohmann::json::array();
  for (const auto& entry : entries) {
    nlohmann::json file;
    file["ordinal"] = entry.ordinal;
    file["name"] = entry.filename;
    file["bytes"] = entry.byte_size;
    file["size"] = utils::FormatFileSize(static_cast<size_t>(entry.byte_size));
    file["lines"] = entry.line_count;
    files.push_back(std::move(file));
  }
  return files;
}

}  // namespace phonegen::output
