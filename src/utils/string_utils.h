/**
 * @file string_utils.h
 * @brief String helpers for request fields, records and file names
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace phonegen::utils {

/**
 * @brief Strip leading and trailing ASCII whitespace
 */
std::string Trim(std::string_view text);

/**
 * @brief True if text has exactly `length` ASCII digits and nothing else
 */
bool IsDigits(std::string_view text, size_t length);

/**
 * @brief Split on a single-character delimiter, keeping empty fields
 */
std::vector<std::string> Split(std::string_view text, char delimiter);

/**
 * @brief Replace path separators ('/' and '\\') with '_'
 *
 * @param text File name component (may contain UTF-8)
 * @return Component safe to use as part of a file name
 */
std::string SanitizeFileNameComponent(const std::string& text);

/**
 * @brief Format a byte count with two decimals and a 1024-based unit
 *
 * Examples: 12 -> "12.00 B", 1536 -> "1.50 KB", 20971520 -> "20.00 MB"
 *
 * @param bytes Number of bytes
 * @return Human-readable string
 */
std::string FormatFileSize(size_t bytes);

}  // namespace phonegen::utils
