/**
 * @file constants.h
 * @brief Common constants used across the codebase
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace phonegen::constants {

// ============================================================================
// Byte unit constants
// ============================================================================

/// Bytes per kilobyte as double (for floating-point calculations)
constexpr double kBytesPerKilobyteDouble = 1024.0;

// ============================================================================
// Number layout
// ============================================================================

/// Digits in the carrier prefix
constexpr size_t kPrefixDigits = 3;

/// Digits in the middle (geographic) segment
constexpr size_t kMiddleSegmentDigits = 4;

/// Digits in the trailing segment
constexpr size_t kTrailingDigits = 4;

/// Digits in a complete number
constexpr size_t kNumberDigits = kPrefixDigits + kMiddleSegmentDigits + kTrailingDigits;

/// Bytes per output line (number plus '\n')
constexpr size_t kLineBytes = kNumberDigits + 1;

/// Valid operator codes are [kMinOperatorCode, kMaxOperatorCode]
constexpr int kMinOperatorCode = 1;
constexpr int kMaxOperatorCode = 5;

// ============================================================================
// Time constants
// ============================================================================

/// Seconds per hour
constexpr int kSecondsPerHour = 3600;

}  // namespace phonegen::constants
