/// @file profile_store.cpp
/// @brief InMemoryProfileStore implementation.

#include "ssg/service/profile_store.hpp"

namespace ssg::service {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

constexpr uint32_t kMinClearance = 1;
constexpr uint32_t kMaxClearance = 5;

ServiceResult<void> profileNotFound() {
    return ServiceResult<void>::err(ServiceError(ErrorCode::NotFound, "profile not found"));
}

}  // namespace

ServiceResult<std::optional<SecurityProfile>> InMemoryProfileStore::find(std::string_view userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(std::string(userId));
    if (it == profiles_.end()) {
        return ServiceResult<std::optional<SecurityProfile>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<SecurityProfile>>::ok(it->second);
}

ServiceResult<std::optional<SecurityProfile>> InMemoryProfileStore::findByEmail(
    std::string_view email) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, profile] : profiles_) {
        if (profile.email == email) {
            return ServiceResult<std::optional<SecurityProfile>>::ok(profile);
        }
    }
    return ServiceResult<std::optional<SecurityProfile>>::ok(std::nullopt);
}

ServiceResult<SecurityProfile> InMemoryProfileStore::create(SecurityProfile profile) {
    if (profile.userId.empty()) {
        return ServiceResult<SecurityProfile>::err(
            ServiceError(ErrorCode::InvalidArgument, "profile requires a user id"));
    }
    if (profile.securityClearance < kMinClearance || profile.securityClearance > kMaxClearance) {
        return ServiceResult<SecurityProfile>::err(
            ServiceError(ErrorCode::InvalidArgument, "clearance must be in [1, 5]"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = profiles_.try_emplace(profile.userId, profile);
    if (!inserted) {
        return ServiceResult<SecurityProfile>::err(
            ServiceError(ErrorCode::AlreadyExists, "profile already exists"));
    }
    return ServiceResult<SecurityProfile>::ok(it->second);
}

ServiceResult<void> InMemoryProfileStore::recordSuccessfulLogin(std::string_view userId,
                                                                TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(std::string(userId));
    if (it == profiles_.end()) {
        return profileNotFound();
    }
    it->second.failedLoginAttempts = 0;
    it->second.accountLocked = false;
    it->second.lastLogin = now;
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryProfileStore::recordFailedLogin(std::string_view email,
                                                            uint32_t lockoutThreshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, profile] : profiles_) {
        if (profile.email == email) {
            ++profile.failedLoginAttempts;
            if (lockoutThreshold > 0 && profile.failedLoginAttempts >= lockoutThreshold) {
                profile.accountLocked = true;
            }
            break;
        }
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryProfileStore::enrollMfa(std::string_view userId, std::string secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(std::string(userId));
    if (it == profiles_.end()) {
        return profileNotFound();
    }
    it->second.mfaSecret = std::move(secret);
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryProfileStore::setClearance(std::string_view userId,
                                                       uint32_t clearance) {
    if (clearance < kMinClearance || clearance > kMaxClearance) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "clearance must be in [1, 5]"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(std::string(userId));
    if (it == profiles_.end()) {
        return profileNotFound();
    }
    it->second.securityClearance = clearance;
    return ServiceResult<void>::ok();
}

std::size_t InMemoryProfileStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.size();
}

}  // namespace ssg::service
