#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the secure session gateway.

#include <cstdint>
#include <string_view>

namespace ssg::foundation {

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
    AlreadyExists = 0x0004,

    // Collaborator (0x0100 - 0x01FF): identity provider, profile store,
    // audit sink and session transport failures.
    SystemError = 0x0100,
    Timeout = 0x0101,
    CollaboratorUnavailable = 0x0102,

    // Auth (0x0500 - 0x05FF)
    ValidationError = 0x0500,
    RateLimitExceeded = 0x0501,
    CredentialRejected = 0x0502,
    MfaRequired = 0x0503,
    MfaRejected = 0x0504,
    IntegrityError = 0x0505,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Task (0x0700 - 0x07FF)
    TaskError = 0x0700,
    TaskScheduleFailed = 0x0701,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Crypto (0x0900 - 0x09FF)
    CryptoError = 0x0900,
    InvalidKey = 0x0901,
    RandomFailure = 0x0902,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Collaborator";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0700: return "Task";
        case 0x0800: return "Logger";
        case 0x0900: return "Crypto";
        default: return "Unknown";
    }
}

/// Message shown to callers for both rejected credentials and rejected
/// session tokens. The two must stay indistinguishable.
inline constexpr std::string_view kGenericAuthFailure = "authentication failed";

} // namespace ssg::foundation
