/**
 * @file types.hpp
 * @brief Core type definitions for UuidKit
 *
 * Timestamps decoded from UUIDs are whole-second instants carried at
 * millisecond precision on the system clock (UTC).
 */

#pragma once

#include <cstdint>
#include <chrono>

namespace uuidkit {

// ============================================================================
// Time Types
// ============================================================================

using Milliseconds = std::chrono::milliseconds;

/// UTC instant with millisecond resolution
using UtcTime = std::chrono::time_point<std::chrono::system_clock, Milliseconds>;

/// 100-nanosecond intervals per second (RFC 4122 timestamp unit)
constexpr uint64_t kTicksPerSecond = 10'000'000;

/// Seconds between the Gregorian epoch (1582-10-15) and the Unix epoch
constexpr int64_t kGregorianToUnixSeconds = 12'219'292'800;

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    // General errors
    Unknown,
    InvalidArgument,

    // Value errors
    OutOfRange,
    InvalidLength,
    InvalidFormat,

    // I/O errors
    FileOpenFailed,
    InvalidData,
};

/// Convert ErrorCode to string
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::OutOfRange: return "Value out of range";
        case ErrorCode::InvalidLength: return "Invalid length";
        case ErrorCode::InvalidFormat: return "Invalid format";
        case ErrorCode::FileOpenFailed: return "File open failed";
        case ErrorCode::InvalidData: return "Invalid data";
        default: return "Unknown error code";
    }
}

} // namespace uuidkit
