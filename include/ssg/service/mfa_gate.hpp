#pragma once

/// @file mfa_gate.hpp
/// @brief Second-factor gate: clearance threshold, challenges and TOTP.
///
/// TOTP follows RFC 6238 with HMAC-SHA1 and 6-digit codes. Challenges are
/// opaque random references that bind a pending login to its subject;
/// each can be consumed once and only before it expires.

#include "ssg/foundation/service_result.hpp"
#include "ssg/service/auth_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ssg::service {

/// MFA gate tunables.
struct MfaOptions {
    std::chrono::seconds step{30};
    uint32_t skewSteps = 1;
    std::chrono::seconds challengeTtl{300};
};

/// Thread-safe MFA decision gate.
///
/// Example:
/// @code
///   MfaGate gate;
///   if (gate.required(profile.securityClearance)) {
///       auto challenge = gate.issueChallenge(profile.userId);
///       // ... later, with the user's code:
///       bool ok = gate.consumeChallenge(challenge.value(), profile.userId) &&
///                 gate.verify(*profile.mfaSecret, code, now, profile.userId);
///   }
/// @endcode
class MfaGate {
public:
    static constexpr std::size_t kSecretLength = 20;
    static constexpr std::size_t kChallengeLength = 32;
    static constexpr int kDigits = 6;

    /// Clearance above which a second factor is mandatory. Not tunable.
    static constexpr uint32_t kClearanceThreshold = 2;

    explicit MfaGate(MfaOptions options = {});

    /// True iff @p clearance exceeds kClearanceThreshold.
    [[nodiscard]] bool required(uint32_t clearance) const noexcept;

    /// Issue a single-use challenge reference bound to @p subject.
    [[nodiscard]] foundation::ServiceResult<std::string> issueChallenge(
        std::string_view subject, TimePoint now = std::chrono::system_clock::now());

    /// Consume @p token. True iff it exists, has not expired and was issued
    /// for @p subject. A found token is removed whatever the outcome.
    [[nodiscard]] bool consumeChallenge(std::string_view token,
                                        std::string_view subject,
                                        TimePoint now = std::chrono::system_clock::now());

    /// Verify a TOTP @p code against base32 @p secret at @p now, accepting
    /// skewSteps steps of drift either side.
    ///
    /// With a non-empty @p subject, a code for a time step at or before the
    /// last step accepted for that subject is rejected as a replay.
    [[nodiscard]] bool verify(std::string_view secret, std::string_view code,
                              TimePoint now = std::chrono::system_clock::now(),
                              std::string_view subject = {});

    /// Drop expired challenges and stale replay markers.
    std::size_t purgeExpired(TimePoint now = std::chrono::system_clock::now());

    [[nodiscard]] std::size_t pendingChallenges() const;

    [[nodiscard]] const MfaOptions& options() const noexcept { return options_; }

    /// Random 20-byte secret, base32-encoded, for enrolment.
    [[nodiscard]] static foundation::ServiceResult<std::string> generateSecret();

    /// RFC 6238 code for @p secret at @p time. nullopt if the secret is not
    /// valid base32 or @p time precedes the epoch.
    [[nodiscard]] static std::optional<std::string> totpCode(
        std::string_view secret, TimePoint time,
        std::chrono::seconds step = std::chrono::seconds{30});

private:
    struct Challenge {
        std::string subject;
        TimePoint expiresAt;
    };

    [[nodiscard]] int64_t counterAt(TimePoint t) const;

    MfaOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Challenge> challenges_;
    std::unordered_map<std::string, int64_t> lastAcceptedStep_;
};

}  // namespace ssg::service
