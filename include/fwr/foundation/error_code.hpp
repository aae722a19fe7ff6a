#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the watch/dispatch framework.

#include <cstdint>
#include <string_view>

namespace fwr::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Watch (0x0100 - 0x01FF)
    WatchInitFailed = 0x0100,
    TooManyTargets = 0x0101,
    WatchAddFailed = 0x0102,
    WatchSourceError = 0x0103,
    WatchClosed = 0x0104,

    // Process (0x0200 - 0x02FF)
    ProcessStartFailed = 0x0200,
    ProcessTimeout = 0x0201,
    ProcessExitFailure = 0x0202,
    ProcessSignaled = 0x0203,
    ProcessKillFailed = 0x0204,

    // Config (0x0300 - 0x03FF)
    ConfigLoadFailed = 0x0300,
    ConfigKeyNotFound = 0x0301,
    ConfigTypeMismatch = 0x0302,
    ConfigInvalidValue = 0x0303,

    // Logger (0x0400 - 0x04FF)
    LoggerError = 0x0400,
    LoggerFlushFailed = 0x0401,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Watch";
        case 0x0200: return "Process";
        case 0x0300: return "Config";
        case 0x0400: return "Logger";
        default: return "Unknown";
    }
}

} // namespace fwr::foundation
