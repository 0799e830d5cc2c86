/**
 * @file error.cpp
 * @brief Error code names and formatting
 */

#include "utils/error.h"

#include <sstream>

namespace phonegen::utils {

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown error";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kNotImplemented:
      return "Not implemented";
    case ErrorCode::kPermissionDenied:
      return "Permission denied";
    case ErrorCode::kIOError:
      return "I/O error";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kCancelled:
      return "Cancelled";

    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";

    case ErrorCode::kMySQLConnectionFailed:
      return "MySQL connection failed";
    case ErrorCode::kMySQLQueryFailed:
      return "MySQL query failed";
    case ErrorCode::kMySQLDisconnected:
      return "MySQL disconnected";

    case ErrorCode::kLookupDuplicateKey:
      return "Duplicate lookup key";
    case ErrorCode::kLookupInvalidRecord:
      return "Invalid lookup record";
    case ErrorCode::kLoaderFileNotFound:
      return "Record source file not found";
    case ErrorCode::kLoaderReadError:
      return "Record source read error";

    case ErrorCode::kPlanValidationError:
      return "Request validation error";
    case ErrorCode::kPlanLimitExceeded:
      return "Count limit exceeded";

    case ErrorCode::kPartitionFailed:
      return "Partition failed";
    case ErrorCode::kOutputWriteFailed:
      return "Output write failed";
    case ErrorCode::kOutputDirectoryError:
      return "Output directory error";
  }
  return "Unknown error";
}

std::string Error::to_string() const {
  std::ostringstream oss;
  oss << "[" << ErrorCodeToString(code_) << " (" << static_cast<int32_t>(code_) << ")] " << message_;
  if (!context_.empty()) {
    oss << " (context: " << context_ << ")";
  }
  return oss.str();
}

}  // namespace phonegen::utils
