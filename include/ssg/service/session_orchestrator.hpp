#pragma once

/// @file session_orchestrator.hpp
/// @brief Login / logout / access-check state machine.
///
/// Composes RateLimiter, the identity provider, the profile store, MfaGate
/// and SessionCipher. Holds no cryptographic logic itself and keeps no
/// server-side copy of issued sessions: the sealed cookie is the session.

#include "ssg/foundation/service_result.hpp"
#include "ssg/service/auth_config.hpp"
#include "ssg/service/auth_types.hpp"
#include "ssg/service/session_cipher.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace ssg::foundation {
class TaskExecutor;
}

namespace ssg::service {

class AuditLogger;
class IAuditSink;
class IIdentityProvider;
class IProfileStore;
class ISessionTransport;
class IpBlocklist;
class MfaGate;
class RateLimiter;

/// External collaborators consumed by the orchestrator.
struct SessionCollaborators {
    std::shared_ptr<IIdentityProvider> identity;
    std::shared_ptr<IProfileStore> profiles;
    std::shared_ptr<IAuditSink> audit;
};

/// Resolve the session key from @p config: the configured hex key, or a
/// freshly generated one (with a warning) when none is configured.
[[nodiscard]] foundation::ServiceResult<SessionKey> loadSessionKey(const AuthConfig& config);

/// Example:
/// @code
///   auto key = loadSessionKey(config);
///   SessionOrchestrator orchestrator(config, key.value(),
///       {identityProvider, profileStore, auditSink});
///
///   InMemorySessionTransport cookies;
///   auto outcome = orchestrator.login({"alice@example.com", "pw"},
///                                     {"203.0.113.7", "curl/8"}, cookies);
///   if (outcome && outcome.value().succeeded()) {
///       bool admin = orchestrator.checkAccess(cookies, 4);
///   }
/// @endcode
class SessionOrchestrator {
public:
    using Clock = std::function<TimePoint()>;

    /// Construct with configuration, the session key and collaborators.
    /// An empty @p clock uses system_clock.
    SessionOrchestrator(AuthConfig config,
                        const SessionKey& key,
                        SessionCollaborators collaborators,
                        Clock clock = {});

    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;
    SessionOrchestrator(SessionOrchestrator&&) noexcept;
    SessionOrchestrator& operator=(SessionOrchestrator&&) noexcept;

    /// Run the login state machine.
    ///
    /// Every denial (validation, rate limit, credentials, MFA) is returned
    /// as an ok result carrying a LoginOutcome. Only collaborator failures
    /// and timeouts are returned as errors, after a best-effort
    /// login_system_error audit event.
    [[nodiscard]] foundation::ServiceResult<LoginOutcome> login(const LoginRequest& request,
                                                                const ClientInfo& client,
                                                                ISessionTransport& transport);

    /// End the session held by @p transport.
    ///
    /// A missing or unopenable token is treated as already logged out.
    /// The cookie is removed even if auditing or provider sign-out fails.
    [[nodiscard]] foundation::ServiceResult<void> logout(ISessionTransport& transport);

    /// True iff @p transport holds a valid, unexpired session whose
    /// clearance is at least @p requiredClearance.
    [[nodiscard]] bool checkAccess(const ISessionTransport& transport,
                                   uint32_t requiredClearance) const;

    /// The valid, unexpired session context held by @p transport.
    [[nodiscard]] std::optional<SecurityContext> currentContext(
        const ISessionTransport& transport) const;

    /// Evict stale rate-limit counters, expired MFA challenges and
    /// expired IP blocks. Returns the number of entries removed.
    std::size_t purgeExpired();

    [[nodiscard]] RateLimiter& rateLimiter() noexcept { return *rateLimiter_; }
    [[nodiscard]] MfaGate& mfaGate() noexcept { return *mfaGate_; }
    [[nodiscard]] IpBlocklist& blocklist() noexcept { return *blocklist_; }
    [[nodiscard]] const AuthConfig& config() const noexcept { return config_; }

private:
    struct LoginRun;

    [[nodiscard]] foundation::ServiceResult<LoginOutcome> deny(
        LoginRun& run, LoginState state, foundation::ServiceError error,
        std::optional<AuditEvent> event);
    [[nodiscard]] foundation::ServiceResult<LoginOutcome> failSystem(
        LoginRun& run, std::string_view stage, foundation::ServiceError error);
    [[nodiscard]] foundation::ServiceResult<SecurityProfile> resolveProfile(
        const IdentityRecord& identity, TimePoint now);
    [[nodiscard]] foundation::ServiceResult<void> recordAttempt(LoginRun& run, bool success,
                                                                std::string_view reason);
    [[nodiscard]] std::optional<SecurityContext> openContext(std::string_view token) const;
    [[nodiscard]] TimePoint now() const;

    AuthConfig config_;
    SessionCollaborators collaborators_;
    Clock clock_;
    std::shared_ptr<foundation::TaskExecutor> executor_;
    std::shared_ptr<foundation::TaskExecutor> auditExecutor_;
    std::shared_ptr<IpBlocklist> blocklist_;
    std::unique_ptr<RateLimiter> rateLimiter_;
    std::unique_ptr<MfaGate> mfaGate_;
    std::unique_ptr<SessionCipher> cipher_;
    std::unique_ptr<AuditLogger> audit_;
};

}  // namespace ssg::service
