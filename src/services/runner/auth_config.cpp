/// @file auth_config.cpp
/// @brief YAML binding for AuthConfig.

#include "ssg/service/auth_config.hpp"

#include "ssg/foundation/config_manager.hpp"
#include "ssg/service/mfa_gate.hpp"

#include <cstdlib>
#include <optional>
#include <string>

namespace ssg::service {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

ServiceResult<AuthConfig> invalid(const std::string& what) {
    return ServiceResult<AuthConfig>::err(
        ServiceError(ErrorCode::ConfigInvalidValue, "invalid configuration: " + what));
}

/// Read an optional key; a present value with the wrong type is an error
/// rather than a silent fallback.
template <typename T>
ServiceResult<bool> readInto(const foundation::ConfigManager& config,
                             const char* key, T& out) {
    auto value = config.get<T>(key);
    if (value.hasValue()) {
        out = std::move(value).value();
        return ServiceResult<bool>::ok(true);
    }
    if (value.error().code() == ErrorCode::ConfigKeyNotFound) {
        return ServiceResult<bool>::ok(false);
    }
    return ServiceResult<bool>::err(std::move(value).error());
}

}  // namespace

ServiceResult<AuthConfig> authConfigFromConfig(const foundation::ConfigManager& config) {
    AuthConfig cfg;

    int64_t windowSeconds = cfg.rateLimitWindow.count();
    int64_t stepSeconds = cfg.totpStep.count();
    int64_t challengeTtl = cfg.mfaChallengeTtl.count();
    int64_t lifetimeSeconds = cfg.sessionLifetime.count();
    int64_t timeoutMs = cfg.collaboratorTimeout.count();
    int64_t autoBlockSeconds = cfg.autoBlockDuration.count();
    uint32_t mfaThreshold = MfaGate::kClearanceThreshold;

    // Each read either fills the field or leaves the default in place. The
    // first type mismatch is kept and later reads are skipped.
    std::optional<ServiceError> readError;
    auto read = [&](const char* key, auto& field) {
        if (readError) {
            return;
        }
        auto result = readInto(config, key, field);
        if (result.hasError()) {
            readError = std::move(result).error();
        }
    };

    read("rate_limit.max_attempts", cfg.rateLimitMaxAttempts);
    read("rate_limit.window_seconds", windowSeconds);
    read("rate_limit.eviction_multiplier", cfg.rateLimitEvictionMultiplier);
    read("password.pbkdf2_iterations", cfg.pbkdf2Iterations);
    read("mfa.clearance_threshold", mfaThreshold);
    read("mfa.totp_step_seconds", stepSeconds);
    read("mfa.totp_skew_steps", cfg.totpSkewSteps);
    read("mfa.challenge_ttl_seconds", challengeTtl);
    read("session.encryption_key", cfg.sessionKeyHex);
    read("session.cookie_name", cfg.sessionCookieName);
    read("session.lifetime_seconds", lifetimeSeconds);
    read("collaborators.timeout_ms", timeoutMs);
    read("collaborators.threads", cfg.collaboratorThreads);
    read("collaborators.audit_threads", cfg.auditThreads);
    read("collaborators.max_queued", cfg.collaboratorMaxQueued);
    read("response.lockout_threshold", cfg.lockoutThreshold);
    read("response.risk_threshold", cfg.responseRiskThreshold);
    read("response.auto_block_risk_threshold", cfg.autoBlockRiskThreshold);
    read("response.auto_block_seconds", autoBlockSeconds);

    if (readError) {
        return ServiceResult<AuthConfig>::err(std::move(*readError));
    }

    // Secret storage takes precedence over the config file.
    if (const char* envKey = std::getenv("SSG_SESSION_KEY"); envKey != nullptr && *envKey != '\0') {
        cfg.sessionKeyHex = envKey;
    }

    if (cfg.rateLimitMaxAttempts == 0) {
        return invalid("rate_limit.max_attempts must be positive");
    }
    if (windowSeconds <= 0) {
        return invalid("rate_limit.window_seconds must be positive");
    }
    if (cfg.rateLimitEvictionMultiplier < 1) {
        return invalid("rate_limit.eviction_multiplier must be at least 1");
    }
    if (cfg.pbkdf2Iterations < 100000) {
        return invalid("password.pbkdf2_iterations must be at least 100000");
    }
    if (mfaThreshold != MfaGate::kClearanceThreshold) {
        return invalid("mfa.clearance_threshold is fixed at " +
                       std::to_string(MfaGate::kClearanceThreshold));
    }
    if (stepSeconds <= 0 || challengeTtl <= 0 || lifetimeSeconds <= 0 || autoBlockSeconds <= 0) {
        return invalid("durations must be positive");
    }
    if (timeoutMs <= 0) {
        return invalid("collaborators.timeout_ms must be positive");
    }
    if (cfg.collaboratorThreads == 0 || cfg.auditThreads == 0) {
        return invalid("collaborator thread counts must be positive");
    }
    if (cfg.collaboratorMaxQueued == 0) {
        return invalid("collaborators.max_queued must be positive");
    }
    if (cfg.sessionCookieName.empty()) {
        return invalid("session.cookie_name must not be empty");
    }
    if (cfg.responseRiskThreshold < 0 || cfg.responseRiskThreshold > 100 ||
        cfg.autoBlockRiskThreshold < 0 || cfg.autoBlockRiskThreshold > 100) {
        return invalid("risk thresholds must be within [0, 100]");
    }

    cfg.rateLimitWindow = std::chrono::seconds(windowSeconds);
    cfg.totpStep = std::chrono::seconds(stepSeconds);
    cfg.mfaChallengeTtl = std::chrono::seconds(challengeTtl);
    cfg.sessionLifetime = std::chrono::seconds(lifetimeSeconds);
    cfg.collaboratorTimeout = std::chrono::milliseconds(timeoutMs);
    cfg.autoBlockDuration = std::chrono::seconds(autoBlockSeconds);

    return ServiceResult<AuthConfig>::ok(std::move(cfg));
}

}  // namespace ssg::service
