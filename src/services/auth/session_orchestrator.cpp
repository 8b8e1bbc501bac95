/// @file session_orchestrator.cpp
/// @brief SessionOrchestrator implementation of the login state machine.

#include "ssg/service/session_orchestrator.hpp"

#include "crypto_utils.hpp"
#include "ssg/foundation/error_code.hpp"
#include "ssg/foundation/service_error.hpp"
#include "ssg/foundation/service_logger.hpp"
#include "ssg/foundation/task_executor.hpp"
#include "ssg/service/audit_logger.hpp"
#include "ssg/service/audit_sink.hpp"
#include "ssg/service/context_codec.hpp"
#include "ssg/service/identity_provider.hpp"
#include "ssg/service/ip_blocklist.hpp"
#include "ssg/service/mfa_gate.hpp"
#include "ssg/service/profile_store.hpp"
#include "ssg/service/rate_limiter.hpp"
#include "ssg/service/session_cipher.hpp"
#include "ssg/service/session_transport.hpp"

#include <algorithm>
#include <chrono>
#include <string>

namespace ssg::service {

using foundation::ErrorCode;
using foundation::kGenericAuthFailure;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

constexpr std::size_t kSessionIdLength = 32;

std::string_view failureReason(LoginState state) {
    switch (state) {
        case LoginState::ValidationFailed:    return "validation_failed";
        case LoginState::RateLimited:         return "rate_limited";
        case LoginState::CredentialsRejected: return "invalid_credentials";
        case LoginState::MfaPending:          return "mfa_required";
        case LoginState::MfaRejected:         return "mfa_rejected";
        case LoginState::SystemError:         return "system_error";
        default:                              return "unknown";
    }
}

/// Collaborator errors keep their code; anything else a collaborator
/// returns unexpectedly is reported as SystemError.
ServiceError asSystemError(ServiceError error) {
    if (error.isSystemError()) {
        return error;
    }
    return ServiceError(ErrorCode::SystemError, std::string(error.message()));
}

}  // namespace

/// Per-call state carried through the login state machine.
struct SessionOrchestrator::LoginRun {
    const LoginRequest& request;
    const ClientInfo& client;
    TimePoint now;
    LoginState state = LoginState::Start;
    bool attemptRecorded = false;
};

// -- Session key --------------------------------------------------------------

ServiceResult<SessionKey> loadSessionKey(const AuthConfig& config) {
    if (!config.sessionKeyHex.empty()) {
        return SessionKey::fromHex(config.sessionKeyHex);
    }
    SSG_LOG_WARN(LogCategory::Crypto,
                 "no session key configured; generated a per-process key, "
                 "sessions will not survive a restart");
    return SessionKey::generate();
}

// -- Construction / destruction -----------------------------------------------

SessionOrchestrator::SessionOrchestrator(AuthConfig config,
                                         const SessionKey& key,
                                         SessionCollaborators collaborators,
                                         Clock clock)
    : config_(std::move(config)),
      collaborators_(std::move(collaborators)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
      executor_(std::make_shared<foundation::TaskExecutor>(
          std::max<uint32_t>(config_.collaboratorThreads, 1), config_.collaboratorMaxQueued)),
      auditExecutor_(std::make_shared<foundation::TaskExecutor>(
          std::max<uint32_t>(config_.auditThreads, 1), config_.collaboratorMaxQueued)),
      blocklist_(std::make_shared<IpBlocklist>()),
      rateLimiter_(std::make_unique<RateLimiter>(
          RateLimitPolicy{"auth", config_.rateLimitMaxAttempts, config_.rateLimitWindow, true,
                          config_.rateLimitEvictionMultiplier})),
      mfaGate_(std::make_unique<MfaGate>(MfaOptions{config_.totpStep, config_.totpSkewSteps,
                                                    config_.mfaChallengeTtl})),
      cipher_(std::make_unique<SessionCipher>(key)),
      audit_(std::make_unique<AuditLogger>(
          AuditPolicy{config_.responseRiskThreshold, config_.autoBlockRiskThreshold,
                      config_.autoBlockDuration, config_.collaboratorTimeout},
          collaborators_.audit, blocklist_, auditExecutor_)) {}

SessionOrchestrator::~SessionOrchestrator() = default;
SessionOrchestrator::SessionOrchestrator(SessionOrchestrator&&) noexcept = default;
SessionOrchestrator& SessionOrchestrator::operator=(SessionOrchestrator&&) noexcept = default;

TimePoint SessionOrchestrator::now() const {
    return clock_();
}

// -- Login --------------------------------------------------------------------

ServiceResult<LoginOutcome> SessionOrchestrator::login(const LoginRequest& request,
                                                       const ClientInfo& client,
                                                       ISessionTransport& transport) {
    LoginRun run{request, client, now()};

    if (request.email.empty() || request.password.empty()) {
        return deny(run, LoginState::ValidationFailed,
                    ServiceError(ErrorCode::ValidationError, "email and password are required"),
                    std::nullopt);
    }

    // -- START -> RATE_CHECKED ---
    // A blocked IP and an exhausted counter are both answered here, before
    // the identity provider is contacted.
    auto blockedUntil = blocklist_->blockedUntil(client.ipAddress, run.now);
    auto decision = rateLimiter_->check(rateLimiter_->keyFor(client.ipAddress, request.email),
                                        run.now);
    if (blockedUntil || !decision.allowed) {
        auto retryAfter = blockedUntil
                              ? std::chrono::ceil<std::chrono::seconds>(*blockedUntil - run.now)
                              : decision.retryAfter(run.now);

        AuditEvent event;
        event.eventType = AuditEventType::RateLimitExceeded;
        event.subject = request.email;
        event.ipAddress = client.ipAddress;
        event.riskScore = risk::kRateLimited;
        event.timestamp = run.now;
        event.details["reason"] = std::string(blockedUntil ? "ip_blocked" : "too_many_attempts");
        event.details["attempts"] = static_cast<int64_t>(decision.attempts);
        event.details["retry_after_s"] = static_cast<int64_t>(retryAfter.count());

        return deny(run, LoginState::RateLimited,
                    ServiceError(ErrorCode::RateLimitExceeded,
                                 "too many login attempts, try again later", retryAfter),
                    std::move(event));
    }
    run.state = LoginState::RateChecked;

    // -- RATE_CHECKED -> CREDENTIALS_VERIFIED ---
    auto identityProvider = collaborators_.identity;
    auto identity = executor_->callWithTimeout<IdentityRecord>(
        "identity_provider.sign_in",
        [identityProvider, email = request.email, password = request.password] {
            return identityProvider->signInWithPassword(email, password);
        },
        config_.collaboratorTimeout);

    if (identity.hasError()) {
        if (identity.error().code() != ErrorCode::CredentialRejected) {
            return failSystem(run, "identity_provider", std::move(identity).error());
        }

        auto profiles = collaborators_.profiles;
        auto counted = executor_->callWithTimeout<void>(
            "profile_store.record_failed_login",
            [profiles, email = request.email, threshold = config_.lockoutThreshold] {
                return profiles->recordFailedLogin(email, threshold);
            },
            config_.collaboratorTimeout);
        if (counted.hasError()) {
            return failSystem(run, "profile_store", std::move(counted).error());
        }

        AuditEvent event;
        event.eventType = AuditEventType::FailedLogin;
        event.subject = request.email;
        event.ipAddress = client.ipAddress;
        event.riskScore = risk::kCredentialFailure;
        event.timestamp = run.now;
        event.details["reason"] = std::string("invalid_credentials");
        event.details["attempts"] = static_cast<int64_t>(decision.attempts);

        return deny(run, LoginState::CredentialsRejected,
                    ServiceError(ErrorCode::CredentialRejected, std::string(kGenericAuthFailure)),
                    std::move(event));
    }
    run.state = LoginState::CredentialsVerified;
    const auto& user = identity.value();

    // -- CREDENTIALS_VERIFIED -> PROFILE_RESOLVED ---
    auto resolved = resolveProfile(user, run.now);
    if (resolved.hasError()) {
        return failSystem(run, "profile_store", std::move(resolved).error());
    }
    run.state = LoginState::ProfileResolved;
    const auto& profile = resolved.value();

    // -- MFA gate ---
    bool mfaVerified = false;
    if (mfaGate_->required(profile.securityClearance)) {
        if (!request.mfaCode) {
            auto challenge = mfaGate_->issueChallenge(user.userId, run.now);
            if (challenge.hasError()) {
                return failSystem(run, "mfa_challenge", std::move(challenge).error());
            }
            run.state = LoginState::MfaPending;
            if (auto recorded = recordAttempt(run, false, failureReason(LoginState::MfaPending));
                recorded.hasError()) {
                return failSystem(run, "audit_sink", std::move(recorded).error());
            }
            SSG_LOG_INFO(LogCategory::Mfa, "second factor required; challenge issued");

            LoginOutcome outcome;
            outcome.state = LoginState::MfaPending;
            outcome.challengeToken = std::move(challenge).value();
            outcome.error = ServiceError(ErrorCode::MfaRequired, "second factor required");
            return ServiceResult<LoginOutcome>::ok(std::move(outcome));
        }

        std::string_view rejection;
        if (!request.challengeToken ||
            !mfaGate_->consumeChallenge(*request.challengeToken, user.userId, run.now)) {
            rejection = "invalid_challenge";
        } else if (!profile.mfaSecret) {
            rejection = "not_enrolled";
        } else if (!mfaGate_->verify(*profile.mfaSecret, *request.mfaCode, run.now, user.userId)) {
            rejection = "invalid_code";
        }

        if (!rejection.empty()) {
            AuditEvent event;
            event.eventType = AuditEventType::MfaFailure;
            event.subject = user.userId;
            event.ipAddress = client.ipAddress;
            event.riskScore = risk::kMfaFailure;
            event.timestamp = run.now;
            event.details["reason"] = std::string(rejection);

            return deny(run, LoginState::MfaRejected,
                        ServiceError(ErrorCode::MfaRejected, "second factor rejected"),
                        std::move(event));
        }
        mfaVerified = true;
        run.state = LoginState::MfaVerified;
    }

    // -> SESSION_ISSUED ---
    SecurityContext ctx;
    ctx.userId = user.userId;
    ctx.sessionId = detail::secureRandomHex(kSessionIdLength);
    ctx.ipAddress = client.ipAddress;
    ctx.userAgent = client.userAgent;
    ctx.securityClearance = profile.securityClearance;
    ctx.mfaVerified = mfaVerified;
    ctx.lastActivity = run.now;
    if (ctx.sessionId.empty()) {
        return failSystem(run, "session_id",
                          ServiceError(ErrorCode::RandomFailure, "failed to generate session id"));
    }

    auto token = cipher_->seal(encodeContext(ctx));
    if (token.hasError()) {
        return failSystem(run, "session_seal", std::move(token).error());
    }

    // Audit before the cookie is handed out, so no session exists that the
    // audit trail does not know about.
    if (auto recorded = recordAttempt(run, true, {}); recorded.hasError()) {
        return failSystem(run, "audit_sink", std::move(recorded).error());
    }

    AuditEvent event;
    event.eventType = AuditEventType::SuccessfulLogin;
    event.subject = user.userId;
    event.ipAddress = client.ipAddress;
    event.riskScore = risk::kSuccess;
    event.timestamp = run.now;
    event.details["clearance"] = static_cast<int64_t>(ctx.securityClearance);
    event.details["mfa_verified"] = mfaVerified;
    if (auto audited = audit_->record(std::move(event)); audited.hasError()) {
        return failSystem(run, "audit_sink", std::move(audited).error());
    }

    CookieOptions cookie;
    cookie.httpOnly = true;
    cookie.secure = true;
    cookie.sameSite = SameSite::Strict;
    cookie.maxAge = config_.sessionLifetime;
    transport.set(config_.sessionCookieName, std::move(token).value(), cookie);

    run.state = LoginState::SessionIssued;
    LogContext logCtx;
    logCtx.userId = ctx.userId;
    logCtx.ipAddress = ctx.ipAddress;
    logCtx.extra["clearance"] = std::to_string(ctx.securityClearance);
    SSG_LOG_CTX(LogLevel::Info, LogCategory::Session, "session issued", logCtx);

    LoginOutcome outcome;
    outcome.state = LoginState::SessionIssued;
    outcome.context = std::move(ctx);
    return ServiceResult<LoginOutcome>::ok(std::move(outcome));
}

ServiceResult<SecurityProfile> SessionOrchestrator::resolveProfile(const IdentityRecord& identity,
                                                                   TimePoint now) {
    auto profiles = collaborators_.profiles;
    auto timeout = config_.collaboratorTimeout;

    auto found = executor_->callWithTimeout<std::optional<SecurityProfile>>(
        "profile_store.find", [profiles, id = identity.userId] { return profiles->find(id); },
        timeout);
    if (found.hasError()) {
        return ServiceResult<SecurityProfile>::err(std::move(found).error());
    }

    if (found.value()) {
        auto updated = executor_->callWithTimeout<void>(
            "profile_store.record_successful_login",
            [profiles, id = identity.userId, now] {
                return profiles->recordSuccessfulLogin(id, now);
            },
            timeout);
        if (updated.hasError()) {
            return ServiceResult<SecurityProfile>::err(std::move(updated).error());
        }
        auto profile = std::move(*found.value());
        profile.failedLoginAttempts = 0;
        profile.accountLocked = false;
        profile.lastLogin = now;
        return ServiceResult<SecurityProfile>::ok(std::move(profile));
    }

    SecurityProfile fresh;
    fresh.userId = identity.userId;
    fresh.email = identity.email;
    fresh.lastLogin = now;
    auto created = executor_->callWithTimeout<SecurityProfile>(
        "profile_store.create",
        [profiles, fresh] { return profiles->create(fresh); },
        timeout);
    if (created.hasError() && created.error().code() == ErrorCode::AlreadyExists) {
        // Lost a race with a concurrent first login of the same user.
        auto again = executor_->callWithTimeout<std::optional<SecurityProfile>>(
            "profile_store.find", [profiles, id = identity.userId] { return profiles->find(id); },
            timeout);
        if (again.hasError()) {
            return ServiceResult<SecurityProfile>::err(std::move(again).error());
        }
        if (!again.value()) {
            return ServiceResult<SecurityProfile>::err(
                ServiceError(ErrorCode::SystemError, "profile vanished after create conflict"));
        }
        return ServiceResult<SecurityProfile>::ok(std::move(*again.value()));
    }
    if (created.hasError()) {
        return created;
    }
    SSG_LOG_INFO(LogCategory::Session, "created default security profile");
    return created;
}

ServiceResult<void> SessionOrchestrator::recordAttempt(LoginRun& run, bool success,
                                                       std::string_view reason) {
    run.attemptRecorded = true;

    LoginAttempt attempt;
    attempt.email = run.request.email;
    attempt.ipAddress = run.client.ipAddress;
    attempt.userAgent = run.client.userAgent;
    attempt.success = success;
    attempt.timestamp = run.now;
    if (!success) {
        attempt.failureReason = std::string(reason);
    }
    return audit_->recordLoginAttempt(std::move(attempt));
}

ServiceResult<LoginOutcome> SessionOrchestrator::deny(LoginRun& run, LoginState state,
                                                      ServiceError error,
                                                      std::optional<AuditEvent> event) {
    run.state = state;

    if (auto recorded = recordAttempt(run, false, failureReason(state)); recorded.hasError()) {
        return failSystem(run, "audit_sink", std::move(recorded).error());
    }
    if (event) {
        if (auto audited = audit_->record(std::move(*event)); audited.hasError()) {
            return failSystem(run, "audit_sink", std::move(audited).error());
        }
    }

    LoginOutcome outcome;
    outcome.state = state;
    if (const auto* retry = error.context<std::chrono::seconds>()) {
        outcome.retryAfter = *retry;
    }
    outcome.error = std::move(error);
    return ServiceResult<LoginOutcome>::ok(std::move(outcome));
}

ServiceResult<LoginOutcome> SessionOrchestrator::failSystem(LoginRun& run,
                                                            std::string_view stage,
                                                            ServiceError error) {
    auto failure = asSystemError(std::move(error));
    auto reachedState = run.state;
    run.state = LoginState::SystemError;

    LogContext logCtx;
    logCtx.ipAddress = run.client.ipAddress;
    logCtx.extra["stage"] = std::string(stage);
    logCtx.extra["state"] = std::string(toString(reachedState));
    SSG_LOG_CTX(LogLevel::Error, LogCategory::Session,
                "login aborted: " + std::string(failure.message()), logCtx);

    // Best effort: the sink may be the collaborator that failed. Sink
    // errors are already logged by AuditLogger.
    if (!run.attemptRecorded) {
        auto recorded = recordAttempt(run, false, failureReason(LoginState::SystemError));
        if (recorded.hasError()) {
            SSG_LOG_DEBUG(LogCategory::Session, "system error login attempt not recorded");
        }
    }

    AuditEvent event;
    event.eventType = AuditEventType::LoginSystemError;
    event.subject = run.request.email;
    event.ipAddress = run.client.ipAddress;
    event.riskScore = risk::kSystemError;
    event.timestamp = run.now;
    event.details["stage"] = std::string(stage);
    event.details["state"] = std::string(toString(reachedState));
    event.details["error"] = std::string(failure.message());
    if (auto audited = audit_->record(std::move(event)); audited.hasError()) {
        SSG_LOG_DEBUG(LogCategory::Session, "system error audit event not recorded");
    }

    return ServiceResult<LoginOutcome>::err(std::move(failure));
}

// -- Logout -------------------------------------------------------------------

ServiceResult<void> SessionOrchestrator::logout(ISessionTransport& transport) {
    auto token = transport.get(config_.sessionCookieName);
    if (!token) {
        return ServiceResult<void>::ok();
    }

    auto ctx = openContext(*token);
    transport.remove(config_.sessionCookieName);
    if (!ctx) {
        SSG_LOG_DEBUG(LogCategory::Session, "logout with unopenable session; cookie cleared");
        return ServiceResult<void>::ok();
    }

    auto current = now();
    auto durationMs = std::max<int64_t>(
        0, std::chrono::duration_cast<std::chrono::milliseconds>(current - ctx->lastActivity)
               .count());

    AuditEvent event;
    event.eventType = AuditEventType::Logout;
    event.subject = ctx->userId;
    event.ipAddress = ctx->ipAddress;
    event.riskScore = risk::kLogout;
    event.timestamp = current;
    event.details["session_duration_ms"] = static_cast<int64_t>(durationMs);
    auto audited = audit_->record(std::move(event));

    auto identityProvider = collaborators_.identity;
    auto signedOut = executor_->callWithTimeout<void>(
        "identity_provider.sign_out",
        [identityProvider, id = ctx->userId] { return identityProvider->signOut(id); },
        config_.collaboratorTimeout);

    if (signedOut.hasError()) {
        SSG_LOG_ERROR(LogCategory::Session,
                      "provider sign-out failed: " + std::string(signedOut.error().message()));
        return ServiceResult<void>::err(asSystemError(std::move(signedOut).error()));
    }
    if (audited.hasError()) {
        return ServiceResult<void>::err(asSystemError(std::move(audited).error()));
    }

    LogContext logCtx;
    logCtx.userId = ctx->userId;
    logCtx.ipAddress = ctx->ipAddress;
    logCtx.extra["duration_ms"] = std::to_string(durationMs);
    SSG_LOG_CTX(LogLevel::Info, LogCategory::Session, "session ended", logCtx);
    return ServiceResult<void>::ok();
}

// -- Access check -------------------------------------------------------------

std::optional<SecurityContext> SessionOrchestrator::openContext(std::string_view token) const {
    auto plaintext = cipher_->open(token);
    if (plaintext.hasError()) {
        SSG_LOG_DEBUG(LogCategory::Session, "rejected session token");
        return std::nullopt;
    }
    auto ctx = decodeContext(plaintext.value());
    if (ctx.hasError()) {
        SSG_LOG_WARN(LogCategory::Session, "authenticated session blob failed to decode");
        return std::nullopt;
    }
    return std::move(ctx).value();
}

std::optional<SecurityContext> SessionOrchestrator::currentContext(
    const ISessionTransport& transport) const {
    auto token = transport.get(config_.sessionCookieName);
    if (!token) {
        return std::nullopt;
    }
    auto ctx = openContext(*token);
    if (!ctx) {
        return std::nullopt;
    }
    if (now() - ctx->lastActivity > config_.sessionLifetime) {
        SSG_LOG_DEBUG(LogCategory::Session, "session context expired");
        return std::nullopt;
    }
    return ctx;
}

bool SessionOrchestrator::checkAccess(const ISessionTransport& transport,
                                      uint32_t requiredClearance) const {
    auto ctx = currentContext(transport);
    return ctx && ctx->securityClearance >= requiredClearance;
}

// -- Maintenance --------------------------------------------------------------

std::size_t SessionOrchestrator::purgeExpired() {
    auto current = now();
    return rateLimiter_->evictStale(current) + mfaGate_->purgeExpired(current) +
           blocklist_->cleanup(current);
}

}  // namespace ssg::service
