/**
 * @file artifact_naming.h
 * @brief Output file base names
 */

#pragma once

#include <chrono>
#include <string>

#include "plan/filter_request.h"

namespace phonegen::output {

/// Default base name layout; placeholders are replaced by BuildArtifactBaseName()
inline constexpr const char* kDefaultNameTemplate = "{prefix}_{province}_{city}_{suffix}_{timestamp}";

/// Suffix placeholder value when no trailing digits are fixed
inline constexpr const char* kAllSuffixLabel = "ALL";

/**
 * @brief Build the base file name (without extension) for a request
 *
 * Placeholders: {prefix}, {province}, {city}, {suffix} (the fixed trailing
 * digits, or "ALL"), {timestamp} (local time, YYYYmmdd_HHMMSS). Path
 * separators in substituted values are replaced with '_'.
 */
std::string BuildArtifactBaseName(const plan::FilterRequest& request, std::chrono::system_clock::time_point now,
                                  const std::string& name_template = kDefaultNameTemplate);

/**
 * @brief Format a time point as YYYYmmdd_HHMMSS in local time
 */
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

}  // namespace phonegen::output
