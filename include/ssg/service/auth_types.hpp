#pragma once

/// @file auth_types.hpp
/// @brief Core type definitions for the secure session gateway.
///
/// Defines the session context sealed into the transport token, the
/// records emitted to the audit sink, the security profile owned by the
/// profile store, and the login request/outcome exchanged with callers.

#include "ssg/foundation/service_error.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ssg::service {

using TimePoint = std::chrono::system_clock::time_point;

// -- Session context ----------------------------------------------------------

/// Authorization state of one issued session.
///
/// Created once on successful login, sealed into the transport token and
/// never mutated afterwards; a changed context requires a new token. The
/// server keeps no copy.
struct SecurityContext {
    std::string userId;
    std::string sessionId;        ///< 32 random bytes, hex-encoded.
    std::string ipAddress;
    std::string userAgent;
    uint32_t securityClearance = 1;
    bool mfaVerified = false;
    TimePoint lastActivity{};
};

// -- Audit records ------------------------------------------------------------

/// One record per login call, success or failure.
struct LoginAttempt {
    std::string email;
    std::string ipAddress;
    std::string userAgent;
    bool success = false;
    TimePoint timestamp{};
    std::optional<std::string> failureReason;
};

/// Detail value attached to an audit event.
using AuditValue = std::variant<std::string, int64_t, bool>;

/// Audit event types emitted by the orchestrator.
enum class AuditEventType : uint8_t {
    RateLimitExceeded,
    FailedLogin,
    MfaFailure,
    SuccessfulLogin,
    Logout,
    LoginSystemError,
};

[[nodiscard]] constexpr std::string_view toString(AuditEventType type) {
    switch (type) {
        case AuditEventType::RateLimitExceeded: return "rate_limit_exceeded";
        case AuditEventType::FailedLogin:       return "failed_login";
        case AuditEventType::MfaFailure:        return "mfa_failure";
        case AuditEventType::SuccessfulLogin:   return "successful_login";
        case AuditEventType::Logout:            return "logout";
        case AuditEventType::LoginSystemError:  return "login_system_error";
    }
    return "unknown";
}

/// Risk scores attached to each transition of interest.
namespace risk {
inline constexpr int kRateLimited = 80;
inline constexpr int kCredentialFailure = 60;
inline constexpr int kMfaFailure = 70;
inline constexpr int kSuccess = 10;
inline constexpr int kLogout = 5;
inline constexpr int kSystemError = 50;
inline constexpr int kMin = 0;
inline constexpr int kMax = 100;
}  // namespace risk

/// Security-relevant state transition. risk_score is always in [0, 100].
struct AuditEvent {
    AuditEventType eventType = AuditEventType::FailedLogin;
    std::string subject;                            ///< User id, or email before identity is known.
    std::string ipAddress;
    std::map<std::string, AuditValue> details;
    int riskScore = 0;
    std::optional<std::string> automatedResponse;   ///< Set by AuditLogger for high-risk events.
    TimePoint timestamp{};
};

// -- Security profile ---------------------------------------------------------

/// Per-user security profile owned by the profile store.
struct SecurityProfile {
    std::string userId;
    std::string email;
    std::string role = "user";
    uint32_t securityClearance = 1;
    std::optional<std::string> mfaSecret;           ///< Base32 TOTP secret when enrolled.
    std::optional<TimePoint> lastLogin;
    uint32_t failedLoginAttempts = 0;
    bool accountLocked = false;
};

// -- Identity -----------------------------------------------------------------

/// Identity confirmed by the external identity provider.
struct IdentityRecord {
    std::string userId;
    std::string email;
};

// -- Login exchange -----------------------------------------------------------

/// Caller metadata captured by the transport layer.
struct ClientInfo {
    std::string ipAddress;
    std::string userAgent;
};

/// Login form submitted by the caller.
struct LoginRequest {
    std::string email;
    std::string password;
    std::optional<std::string> mfaCode;
    std::optional<std::string> challengeToken;      ///< Returned by a prior MfaPending outcome.
};

/// States of the login state machine.
enum class LoginState : uint8_t {
    Start,
    RateChecked,
    CredentialsVerified,
    ProfileResolved,
    MfaPending,
    MfaVerified,
    SessionIssued,
    ValidationFailed,
    RateLimited,
    CredentialsRejected,
    MfaRejected,
    SystemError,
};

[[nodiscard]] constexpr std::string_view toString(LoginState state) {
    switch (state) {
        case LoginState::Start:               return "START";
        case LoginState::RateChecked:         return "RATE_CHECKED";
        case LoginState::CredentialsVerified: return "CREDENTIALS_VERIFIED";
        case LoginState::ProfileResolved:     return "PROFILE_RESOLVED";
        case LoginState::MfaPending:          return "MFA_PENDING";
        case LoginState::MfaVerified:         return "MFA_VERIFIED";
        case LoginState::SessionIssued:       return "SESSION_ISSUED";
        case LoginState::ValidationFailed:    return "VALIDATION_FAILED";
        case LoginState::RateLimited:         return "RATE_LIMITED";
        case LoginState::CredentialsRejected: return "CREDENTIALS_REJECTED";
        case LoginState::MfaRejected:         return "MFA_REJECTED";
        case LoginState::SystemError:         return "SYSTEM_ERROR";
    }
    return "UNKNOWN";
}

/// Structured result of a login call.
///
/// Exactly one of the following holds:
///  - state == SessionIssued: context is set and the cookie was written.
///  - state == MfaPending: challengeToken is set.
///  - otherwise: error is set (retryAfter is set for RateLimited).
struct LoginOutcome {
    LoginState state = LoginState::Start;
    std::optional<SecurityContext> context;
    std::optional<std::string> challengeToken;
    std::optional<foundation::ServiceError> error;
    std::chrono::seconds retryAfter{0};

    [[nodiscard]] bool succeeded() const noexcept { return state == LoginState::SessionIssued; }
    [[nodiscard]] bool requiresMfa() const noexcept { return state == LoginState::MfaPending; }
};

}  // namespace ssg::service
