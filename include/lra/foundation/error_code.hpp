#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the research agent runtime.

#include <cstdint>
#include <string_view>

namespace lra::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    NotImplemented = 0x0004,

    // Network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    ConnectionFailed = 0x0101,
    ConnectionRefused = 0x0102,
    ConnectionReset = 0x0103,
    ConnectionLost = 0x0104,
    BrokenPipe = 0x0105,
    Timeout = 0x0106,
    RemoteProtocolError = 0x0107,

    // Upstream inference backend (0x0200 - 0x02FF)
    UpstreamHttpError = 0x0200,
    MalformedResponse = 0x0201,
    AuthenticationFailed = 0x0202,
    PermissionDenied = 0x0203,
    ModelNotFound = 0x0204,

    // Resilience layer (0x0300 - 0x03FF)
    RetryExhausted = 0x0300,
    CircuitOpen = 0x0301,
    CircuitHalfOpenLimit = 0x0302,
    RateLimitTimeout = 0x0303,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0200: return "Upstream";
        case 0x0300: return "Resilience";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace lra::foundation
