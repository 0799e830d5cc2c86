/**
 * @file error_test.cpp
 * @brief Unit tests for Error and ErrorCode
 */

#include "utils/error.h"

#include <gtest/gtest.h>

#include <string>

using namespace phonegen::utils;

TEST(ErrorTest, DefaultIsSuccess) {
  Error error;
  EXPECT_EQ(error.code(), ErrorCode::kSuccess);
  EXPECT_FALSE(error.is_error());
  EXPECT_TRUE(error.message().empty());
}

TEST(ErrorTest, CodeOnlyUsesCodeName) {
  Error error(ErrorCode::kPlanLimitExceeded);
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(error.message(), "Count limit exceeded");
}

TEST(ErrorTest, MessageAndContext) {
  auto error = MakeError(ErrorCode::kOutputWriteFailed, "Failed to write output file", "/tmp/x_part1.txt.tmp");
  EXPECT_EQ(error.code(), ErrorCode::kOutputWriteFailed);
  EXPECT_EQ(error.message(), "Failed to write output file");
  EXPECT_EQ(error.context(), "/tmp/x_part1.txt.tmp");
  EXPECT_STREQ(error.what(), "Failed to write output file");
}

/**
 * @brief to_string() carries the code name, numeric code, message and context
 */
TEST(ErrorTest, ToStringFormat) {
  auto error = MakeError(ErrorCode::kLookupDuplicateKey, "Duplicate key 130/0008");
  EXPECT_EQ(error.to_string(), "[Duplicate lookup key (3000)] Duplicate key 130/0008");

  auto with_context = MakeError(ErrorCode::kConfigFileNotFound, "missing", "config.yaml");
  EXPECT_EQ(with_context.to_string(), "[Configuration file not found (1000)] missing (context: config.yaml)");

  std::string converted = with_context;
  EXPECT_EQ(converted, with_context.to_string());
}

/**
 * @brief Codes are grouped by module in ranges of 1000
 */
TEST(ErrorTest, CodeRanges) {
  EXPECT_EQ(static_cast<int32_t>(ErrorCode::kConfigFileNotFound), 1000);
  EXPECT_EQ(static_cast<int32_t>(ErrorCode::kMySQLConnectionFailed), 2000);
  EXPECT_EQ(static_cast<int32_t>(ErrorCode::kLookupDuplicateKey), 3000);
  EXPECT_EQ(static_cast<int32_t>(ErrorCode::kPlanValidationError), 4000);
  EXPECT_EQ(static_cast<int32_t>(ErrorCode::kPartitionFailed), 5000);
}

TEST(ErrorTest, EveryCodeHasAName) {
  const ErrorCode codes[] = {
      ErrorCode::kInvalidArgument,      ErrorCode::kIOError,           ErrorCode::kNotImplemented,
      ErrorCode::kConfigParseError,     ErrorCode::kConfigValidationError, ErrorCode::kMySQLQueryFailed,
      ErrorCode::kLookupInvalidRecord,  ErrorCode::kLoaderFileNotFound, ErrorCode::kLoaderReadError,
      ErrorCode::kPlanValidationError,  ErrorCode::kPartitionFailed,   ErrorCode::kOutputDirectoryError,
  };
  for (ErrorCode code : codes) {
    EXPECT_STRNE(ErrorCodeToString(code), "Unknown error") << static_cast<int32_t>(code);
  }
}

TEST(ErrorTest, MacroAddsLocation) {
  auto error = PHONEGEN_ERROR(ErrorCode::kInternalError, "boom");
  EXPECT_EQ(error.message(), "boom");
  EXPECT_NE(error.context().find("error_test.cpp:"), std::string::npos);
}
