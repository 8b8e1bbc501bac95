#pragma once

/// @file auth_config.hpp
/// @brief Configuration for the secure session gateway and its YAML binding.

#include "ssg/foundation/service_result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ssg::foundation {
class ConfigManager;
}

namespace ssg::service {

/// Gateway configuration. Defaults match production policy.
struct AuthConfig {
    // -- Rate limiting --------------------------------------------------------

    /// Maximum login attempts per (ip, email) within the window.
    uint32_t rateLimitMaxAttempts = 5;

    /// Fixed window length for login attempt counting.
    std::chrono::seconds rateLimitWindow{900};  // 15 minutes

    /// Entries older than window * multiplier are evicted.
    uint32_t rateLimitEvictionMultiplier = 2;

    // -- Password hashing -----------------------------------------------------

    /// PBKDF2-HMAC-SHA512 iteration count. Never below 100000 in production.
    uint32_t pbkdf2Iterations = 100000;

    // -- MFA ------------------------------------------------------------------

    /// TOTP time step.
    std::chrono::seconds totpStep{30};

    /// Accepted TOTP drift, in steps, on either side of the current one.
    uint32_t totpSkewSteps = 1;

    /// Lifetime of an MFA challenge reference.
    std::chrono::seconds mfaChallengeTtl{300};  // 5 minutes

    // -- Session --------------------------------------------------------------

    /// Hex-encoded 256-bit session encryption key. Empty means "generate a
    /// per-process key", which invalidates sessions on restart.
    std::string sessionKeyHex;

    /// Name of the transport cookie.
    std::string sessionCookieName = "security_session";

    /// Cookie max-age and maximum accepted age of a sealed context.
    std::chrono::seconds sessionLifetime{8 * 60 * 60};  // 8 hours

    // -- Collaborators --------------------------------------------------------

    /// Deadline for each identity provider / profile store / audit sink call.
    /// Must be positive.
    std::chrono::milliseconds collaboratorTimeout{2000};

    /// Worker threads for identity provider and profile store calls.
    uint32_t collaboratorThreads = 4;

    /// Worker threads for audit sink calls, kept apart so a hung identity
    /// provider cannot hold up auditing.
    uint32_t auditThreads = 2;

    /// Calls that may wait for a worker on each pool before new ones are
    /// refused.
    uint32_t collaboratorMaxQueued = 64;

    // -- Automated responses --------------------------------------------------

    /// Failed logins after which a profile is marked locked.
    uint32_t lockoutThreshold = 5;

    /// Risk score at which an automated response is recorded.
    int responseRiskThreshold = 80;

    /// Risk score at which the source IP is auto-blocked.
    int autoBlockRiskThreshold = 90;

    /// Duration of an automatic IP block.
    std::chrono::seconds autoBlockDuration{24 * 60 * 60};
};

/// Build an AuthConfig from a loaded ConfigManager.
///
/// Recognised keys (all optional):
///   rate_limit.max_attempts, rate_limit.window_seconds,
///   rate_limit.eviction_multiplier, password.pbkdf2_iterations,
///   mfa.totp_step_seconds, mfa.totp_skew_steps,
///   mfa.challenge_ttl_seconds, session.encryption_key,
///   session.cookie_name, session.lifetime_seconds,
///   collaborators.timeout_ms, collaborators.threads,
///   collaborators.audit_threads, collaborators.max_queued,
///   response.lockout_threshold, response.risk_threshold,
///   response.auto_block_risk_threshold, response.auto_block_seconds
///
/// The SSG_SESSION_KEY environment variable overrides
/// session.encryption_key. mfa.clearance_threshold is accepted only with
/// its fixed value, 2.
///
/// @return ConfigInvalidValue when a value is out of range.
[[nodiscard]] foundation::ServiceResult<AuthConfig> authConfigFromConfig(
    const foundation::ConfigManager& config);

}  // namespace ssg::service
