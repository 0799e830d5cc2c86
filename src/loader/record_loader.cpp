/**
 * @file record_loader.cpp
 * @brief Shared row parsing for record loaders
 */

#include "loader/record_loader.h"

#include <charconv>

#include "utils/constants.h"
#include "utils/string_utils.h"

namespace phonegen::loader {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

utils::Expected<index::GeoOperatorRecord, utils::Error> ParseRecordFields(const std::string& prefix,
                                                                         const std::string& segment,
                                                                         const std::string& province,
                                                                         const std::string& city,
                                                                         const std::string& operator_code) {
  index::GeoOperatorRecord record;
  record.prefix = utils::Trim(prefix);
  record.middle_segment = utils::Trim(segment);
  record.province = utils::Trim(province);
  record.city = utils::Trim(city);

  if (!utils::IsDigits(record.prefix, constants::kPrefixDigits)) {
    return MakeUnexpected(MakeError(ErrorCode::kLookupInvalidRecord, "Invalid prefix: '" + record.prefix + "'"));
  }
  if (!utils::IsDigits(record.middle_segment, constants::kMiddleSegmentDigits)) {
    return MakeUnexpected(
        MakeError(ErrorCode::kLookupInvalidRecord, "Invalid middle segment: '" + record.middle_segment + "'"));
  }
  if (record.province.empty() || record.city.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kLookupInvalidRecord, "Empty province or city"));
  }

  std::string code_text = utils::Trim(operator_code);
  int code = 0;
  auto [ptr, ec] = std::from_chars(code_text.data(), code_text.data() + code_text.size(), code);
  if (ec != std::errc() || ptr != code_text.data() + code_text.size() || code < constants::kMinOperatorCode ||
      code > constants::kMaxOperatorCode) {
    return MakeUnexpected(MakeError(ErrorCode::kLookupInvalidRecord, "Invalid operator code: '" + code_text + "'"));
  }
  record.operator_code = code;
  return record;
}

}  // namespace phonegen::loader
