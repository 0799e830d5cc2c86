/**
 * @file string_utils.cpp
 * @brief String helper implementation
 */

#include "utils/string_utils.h"

#include <array>
#include <cctype>
#include <cstdio>

#include "utils/constants.h"

namespace phonegen::utils {

std::string Trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

bool IsDigits(std::string_view text, size_t length) {
  if (text.size() != length) {
    return false;
  }
  for (char chr : text) {
    if (chr < '0' || chr > '9') {
      return false;
    }
  }
  return true;
}

std::vector<std::string> Split(std::string_view text, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = text.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(text.substr(start));
      break;
    }
    parts.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string SanitizeFileNameComponent(const std::string& text) {
  std::string result = text;
  for (char& chr : result) {
    if (chr == '/' || chr == '\\') {
      chr = '_';
    }
  }
  return result;
}

std::string FormatFileSize(size_t bytes) {
  static constexpr std::array<const char*, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};

  auto size = static_cast<double>(bytes);
  size_t unit = 0;
  while (size >= constants::kBytesPerKilobyteDouble && unit + 1 < kUnits.size()) {
    size /= constants::kBytesPerKilobyteDouble;
    ++unit;
  }

  std::array<char, 32> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "%.2f %s", size, kUnits[unit]);
  return std::string(buffer.data());
}

}  // namespace phonegen::utils
