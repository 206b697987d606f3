#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the auth service.

#include <cstdint>
#include <string_view>

namespace oas::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the originating
/// subsystem can be recovered from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Store (0x0200 - 0x02FF)
    StoreError = 0x0200,
    StoreUnavailable = 0x0201,
    StoreTimeout = 0x0202,
    StoreCorruptRecord = 0x0203,

    // Auth (0x0500 - 0x05FF)
    AuthenticationFailed = 0x0500,
    InvalidCredentials = 0x0501,
    AccountNotActive = 0x0502,
    AccountLocked = 0x0503,
    InvalidToken = 0x0504,
    PermissionDenied = 0x0505,
    InvalidExpiry = 0x0506,
    CryptoFailure = 0x0507,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0200: return "Store";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// True for failures of the backing store. These are retriable and must
/// never be reported to callers as an invalid token or bad credentials.
constexpr bool isStoreFailure(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0200;
}

} // namespace oas::foundation
