#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the security manager.

#include <cstdint>
#include <string_view>

namespace warden::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read off the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    Timeout = 0x0005,

    // Config (0x0100 - 0x01FF)
    ConfigurationError = 0x0100,
    ConfigLoadFailed = 0x0101,
    ConfigKeyNotFound = 0x0102,
    ConfigTypeMismatch = 0x0103,

    // Authentication (0x0200 - 0x02FF)
    AuthenticationFailed = 0x0200,
    InvalidCredentials = 0x0201,
    UnknownAccount = 0x0202,
    AccountLocked = 0x0203,
    VerificationError = 0x0204,
    MfaRequired = 0x0205,

    // MFA (0x0300 - 0x03FF)
    ExpiredChallenge = 0x0300,
    InvalidChallenge = 0x0301,
    ChallengeReplayed = 0x0302,
    MfaNotEnrolled = 0x0303,

    // Authorization (0x0400 - 0x04FF)
    PermissionDenied = 0x0400,
    RoleDenied = 0x0401,
    InvalidPermission = 0x0402,

    // Session (0x0500 - 0x05FF)
    SessionExpired = 0x0500,
    SessionNotFound = 0x0501,
    InvalidSessionCookie = 0x0502,

    // Store (0x0600 - 0x06FF)
    StoreUnavailable = 0x0600,
    RecordNotFound = 0x0601,

    // Cache (0x0700 - 0x07FF)
    CacheUnavailable = 0x0700,
    CacheDecodeFailed = 0x0701,

    // Crypto (0x0800 - 0x08FF)
    CryptoFailure = 0x0800,
    DecryptionFailed = 0x0801,

    // Thread (0x0900 - 0x09FF)
    JobScheduleFailed = 0x0900,
    JobCancelled = 0x0901,

    // Logger (0x0A00 - 0x0AFF)
    LoggerFlushFailed = 0x0A00,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Authc";
        case 0x0300: return "Mfa";
        case 0x0400: return "Authz";
        case 0x0500: return "Session";
        case 0x0600: return "Store";
        case 0x0700: return "Cache";
        case 0x0800: return "Crypto";
        case 0x0900: return "Thread";
        case 0x0A00: return "Logger";
        default: return "Unknown";
    }
}

/// Whether the error is transient and the operation may be retried.
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::StoreUnavailable || code == ErrorCode::CacheUnavailable ||
           code == ErrorCode::Timeout;
}

} // namespace warden::foundation
