/// @file identity_provider.cpp
/// @brief InMemoryIdentityProvider implementation.

#include "ssg/service/identity_provider.hpp"

namespace ssg::service {

using foundation::ErrorCode;
using foundation::kGenericAuthFailure;
using foundation::ServiceError;
using foundation::ServiceResult;

InMemoryIdentityProvider::InMemoryIdentityProvider(PasswordHasher hasher)
    : hasher_(std::move(hasher)) {}

ServiceResult<std::string> InMemoryIdentityProvider::registerUser(std::string_view email,
                                                                  std::string_view password) {
    if (email.empty() || password.empty()) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::ValidationError, "email and password are required"));
    }

    // Hash outside the lock.
    auto hashed = hasher_.hash(password);
    if (hashed.hasError()) {
        return ServiceResult<std::string>::err(std::move(hashed).error());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string key(email);
    if (accounts_.count(key) != 0) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::AlreadyExists, "email already registered"));
    }
    auto userId = "user-" + std::to_string(nextId_++);
    accounts_.emplace(std::move(key), Account{userId, hashed.value().encoded()});
    return ServiceResult<std::string>::ok(std::move(userId));
}

ServiceResult<IdentityRecord> InMemoryIdentityProvider::signInWithPassword(
    std::string_view email, std::string_view password) {
    ++signInCalls_;

    Account account;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(std::string(email));
        if (it != accounts_.end()) {
            account = it->second;
        }
    }

    // Unknown emails still pay for one derivation so both rejections take
    // comparable time.
    static const std::string kDummyHash =
        std::string(PasswordHasher::kSaltLength * 2, '0') + ":" +
        std::string(PasswordHasher::kDerivedLength * 2, '0');
    bool ok = hasher_.verify(password, account.userId.empty() ? kDummyHash : account.passwordHash);
    if (!ok || account.userId.empty()) {
        return ServiceResult<IdentityRecord>::err(
            ServiceError(ErrorCode::CredentialRejected, std::string(kGenericAuthFailure)));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeSessions_.insert(account.userId);
    }
    return ServiceResult<IdentityRecord>::ok(IdentityRecord{account.userId, std::string(email)});
}

ServiceResult<void> InMemoryIdentityProvider::signOut(std::string_view userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    activeSessions_.erase(std::string(userId));
    return ServiceResult<void>::ok();
}

bool InMemoryIdentityProvider::hasActiveSession(std::string_view userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeSessions_.count(std::string(userId)) != 0;
}

}  // namespace ssg::service
