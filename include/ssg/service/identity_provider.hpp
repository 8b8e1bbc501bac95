#pragma once

/// @file identity_provider.hpp
/// @brief Identity provider interface and in-memory implementation.
///
/// The provider owns credentials. The gateway only learns whether an
/// email/password pair is accepted and which user id it belongs to.

#include "ssg/foundation/service_result.hpp"
#include "ssg/service/auth_types.hpp"
#include "ssg/service/password_hasher.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace ssg::service {

/// Abstract credential verifier.
///
/// Implementations must be thread-safe. A rejected credential is reported
/// as ErrorCode::CredentialRejected; anything else (unreachable, internal
/// failure) as a Collaborator-subsystem error.
class IIdentityProvider {
public:
    virtual ~IIdentityProvider() = default;

    [[nodiscard]] virtual foundation::ServiceResult<IdentityRecord> signInWithPassword(
        std::string_view email, std::string_view password) = 0;

    /// Invalidate the provider-side session of @p userId.
    [[nodiscard]] virtual foundation::ServiceResult<void> signOut(std::string_view userId) = 0;
};

/// Thread-safe in-memory identity provider for testing and development.
/// Passwords are stored as PBKDF2 hashes.
class InMemoryIdentityProvider : public IIdentityProvider {
public:
    explicit InMemoryIdentityProvider(PasswordHasher hasher = PasswordHasher{});

    /// Register @p email and return the assigned user id.
    [[nodiscard]] foundation::ServiceResult<std::string> registerUser(std::string_view email,
                                                                      std::string_view password);

    [[nodiscard]] foundation::ServiceResult<IdentityRecord> signInWithPassword(
        std::string_view email, std::string_view password) override;

    [[nodiscard]] foundation::ServiceResult<void> signOut(std::string_view userId) override;

    /// Number of signInWithPassword calls so far.
    [[nodiscard]] uint64_t signInCalls() const noexcept { return signInCalls_.load(); }

    [[nodiscard]] bool hasActiveSession(std::string_view userId) const;

private:
    struct Account {
        std::string userId;
        std::string passwordHash;
    };

    PasswordHasher hasher_;
    std::atomic<uint64_t> signInCalls_{0};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Account> accounts_;  // keyed by email
    std::unordered_set<std::string> activeSessions_;
    uint64_t nextId_ = 1;
};

}  // namespace ssg::service
