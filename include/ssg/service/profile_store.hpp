#pragma once

/// @file profile_store.hpp
/// @brief Security profile store interface and in-memory implementation.

#include "ssg/foundation/service_result.hpp"
#include "ssg/service/auth_types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ssg::service {

/// Abstract security profile persistence.
///
/// Implementations must be thread-safe. Storage failures are reported as
/// Collaborator-subsystem errors.
class IProfileStore {
public:
    virtual ~IProfileStore() = default;

    [[nodiscard]] virtual foundation::ServiceResult<std::optional<SecurityProfile>> find(
        std::string_view userId) = 0;

    [[nodiscard]] virtual foundation::ServiceResult<std::optional<SecurityProfile>> findByEmail(
        std::string_view email) = 0;

    /// Insert @p profile. AlreadyExists if the user id is taken.
    [[nodiscard]] virtual foundation::ServiceResult<SecurityProfile> create(
        SecurityProfile profile) = 0;

    /// Clear the failed-attempt counter and lock, and set last_login.
    [[nodiscard]] virtual foundation::ServiceResult<void> recordSuccessfulLogin(
        std::string_view userId, TimePoint now) = 0;

    /// Increment the failed-attempt counter of the profile owning @p email
    /// and lock it once the counter reaches @p lockoutThreshold.
    /// Unknown emails are ignored.
    [[nodiscard]] virtual foundation::ServiceResult<void> recordFailedLogin(
        std::string_view email, uint32_t lockoutThreshold) = 0;
};

/// Thread-safe in-memory profile store for testing and development.
class InMemoryProfileStore : public IProfileStore {
public:
    [[nodiscard]] foundation::ServiceResult<std::optional<SecurityProfile>> find(
        std::string_view userId) override;

    [[nodiscard]] foundation::ServiceResult<std::optional<SecurityProfile>> findByEmail(
        std::string_view email) override;

    [[nodiscard]] foundation::ServiceResult<SecurityProfile> create(
        SecurityProfile profile) override;

    [[nodiscard]] foundation::ServiceResult<void> recordSuccessfulLogin(
        std::string_view userId, TimePoint now) override;

    [[nodiscard]] foundation::ServiceResult<void> recordFailedLogin(
        std::string_view email, uint32_t lockoutThreshold) override;

    /// Store a base32 TOTP secret for @p userId.
    [[nodiscard]] foundation::ServiceResult<void> enrollMfa(std::string_view userId,
                                                            std::string secret);

    /// Clearance must be in [1, 5].
    [[nodiscard]] foundation::ServiceResult<void> setClearance(std::string_view userId,
                                                               uint32_t clearance);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SecurityProfile> profiles_;  // keyed by user id
};

}  // namespace ssg::service
