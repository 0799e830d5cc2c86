/**
 * @file error.h
 * @brief Error codes and Error value type
 *
 * Error codes are grouped by module in ranges of 1000 so that the module
 * which produced an error can be read off the numeric code.
 */

#pragma once

#include <cstdint>
#include <string>

namespace phonegen::utils {

/**
 * @brief Error code taxonomy
 */
enum class ErrorCode : int32_t {
  // General (0-999)
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotImplemented = 4,
  kPermissionDenied = 5,
  kIOError = 6,
  kInternalError = 7,
  kNotFound = 8,
  kAlreadyExists = 9,
  kTimeout = 10,
  kCancelled = 11,

  // Configuration (1000-1999)
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,

  // MySQL record source (2000-2999)
  kMySQLConnectionFailed = 2000,
  kMySQLQueryFailed = 2001,
  kMySQLDisconnected = 2002,

  // Record loading and lookup index (3000-3999)
  kLookupDuplicateKey = 3000,
  kLookupInvalidRecord = 3001,
  kLoaderFileNotFound = 3002,
  kLoaderReadError = 3003,

  // Constraint resolution (4000-4999)
  kPlanValidationError = 4000,
  kPlanLimitExceeded = 4001,

  // Generation and output (5000-5999)
  kPartitionFailed = 5000,
  kOutputWriteFailed = 5001,
  kOutputDirectoryError = 5002,
};

/**
 * @brief Human-readable name of an error code
 */
const char* ErrorCodeToString(ErrorCode code);

/**
 * @brief Error value carried by Expected<T, Error>
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }
  [[nodiscard]] bool is_error() const { return code_ != ErrorCode::kSuccess; }

  /**
   * @brief Format as "[<code name> (<code>)] <message> (context: <context>)"
   */
  [[nodiscard]] std::string to_string() const;

  // NOLINTNEXTLINE(google-explicit-constructor)
  operator std::string() const { return to_string(); }

  [[nodiscard]] const char* what() const { return message_.c_str(); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

}  // namespace phonegen::utils

// Attach the source location as error context
#define PHONEGEN_ERROR(code, message) \
  ::phonegen::utils::MakeError((code), (message), std::string(__FILE__) + ":" + std::to_string(__LINE__))
