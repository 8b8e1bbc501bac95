/// @file mfa_gate.cpp
/// @brief MfaGate implementation: RFC 6238 TOTP over OpenSSL HMAC-SHA1.

#include "ssg/service/mfa_gate.hpp"

#include "crypto_utils.hpp"
#include "ssg/foundation/service_logger.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>

namespace ssg::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

constexpr uint32_t kDigitsModulus = 1000000;

/// HOTP value (RFC 4226) for one counter. nullopt if HMAC fails.
std::optional<std::string> hotp(const std::vector<uint8_t>& key, uint64_t counter) {
    std::array<uint8_t, 8> msg{};
    for (int i = 7; i >= 0; --i) {
        msg[static_cast<std::size_t>(i)] = static_cast<uint8_t>(counter & 0xFF);
        counter >>= 8;
    }

    std::array<uint8_t, EVP_MAX_MD_SIZE> mac{};
    unsigned int macLen = 0;
    if (HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()), msg.data(), msg.size(),
             mac.data(), &macLen) == nullptr ||
        macLen < 20) {
        return std::nullopt;
    }

    auto offset = static_cast<std::size_t>(mac[macLen - 1] & 0x0F);
    uint32_t binary = (static_cast<uint32_t>(mac[offset] & 0x7F) << 24) |
                      (static_cast<uint32_t>(mac[offset + 1]) << 16) |
                      (static_cast<uint32_t>(mac[offset + 2]) << 8) |
                      static_cast<uint32_t>(mac[offset + 3]);

    std::string code = std::to_string(binary % kDigitsModulus);
    code.insert(0, static_cast<std::size_t>(MfaGate::kDigits) - code.size(), '0');
    return code;
}

bool isNumericCode(std::string_view code) {
    return code.size() == static_cast<std::size_t>(MfaGate::kDigits) &&
           std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

MfaGate::MfaGate(MfaOptions options) : options_(options) {
    if (options_.step.count() <= 0) {
        options_.step = std::chrono::seconds{30};
    }
}

bool MfaGate::required(uint32_t clearance) const noexcept {
    return clearance > kClearanceThreshold;
}

int64_t MfaGate::counterAt(TimePoint t) const {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    if (secs < 0) {
        return -1;
    }
    return secs / options_.step.count();
}

// -- Challenges ---------------------------------------------------------------

ServiceResult<std::string> MfaGate::issueChallenge(std::string_view subject, TimePoint now) {
    auto token = detail::secureRandomHex(kChallengeLength);
    if (token.empty()) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::RandomFailure, "failed to generate MFA challenge"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = challenges_.begin(); it != challenges_.end();) {
        if (it->second.expiresAt <= now) {
            it = challenges_.erase(it);
        } else {
            ++it;
        }
    }
    challenges_[token] = Challenge{std::string(subject), now + options_.challengeTtl};
    return ServiceResult<std::string>::ok(std::move(token));
}

bool MfaGate::consumeChallenge(std::string_view token, std::string_view subject, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = challenges_.find(std::string(token));
    if (it == challenges_.end()) {
        return false;
    }
    bool valid = it->second.expiresAt > now && it->second.subject == subject;
    challenges_.erase(it);
    if (!valid) {
        SSG_LOG_WARN(LogCategory::Mfa, "rejected expired or mismatched MFA challenge");
    }
    return valid;
}

// -- TOTP ---------------------------------------------------------------------

bool MfaGate::verify(std::string_view secret, std::string_view code, TimePoint now,
                     std::string_view subject) {
    if (!isNumericCode(code)) {
        return false;
    }
    auto key = detail::base32Decode(secret);
    if (!key || key->empty()) {
        return false;
    }

    auto current = counterAt(now);
    if (current < 0) {
        detail::secureWipe(*key);
        return false;
    }

    auto skew = static_cast<int64_t>(options_.skewSteps);
    std::optional<int64_t> matched;
    for (int64_t counter = current - skew; counter <= current + skew; ++counter) {
        if (counter < 0) {
            continue;
        }
        auto expected = hotp(*key, static_cast<uint64_t>(counter));
        // Every candidate is compared so timing does not reveal the matching step.
        if (expected && detail::constantTimeEqual(*expected, code) && !matched) {
            matched = counter;
        }
    }
    detail::secureWipe(*key);

    if (!matched) {
        return false;
    }
    if (subject.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = lastAcceptedStep_.try_emplace(std::string(subject), *matched);
    if (!inserted) {
        if (*matched <= it->second) {
            SSG_LOG_WARN(LogCategory::Mfa, "rejected replayed TOTP code");
            return false;
        }
        it->second = *matched;
    }
    return true;
}

std::size_t MfaGate::purgeExpired(TimePoint now) {
    auto oldestLive = counterAt(now) - static_cast<int64_t>(options_.skewSteps);
    std::size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = challenges_.begin(); it != challenges_.end();) {
        if (it->second.expiresAt <= now) {
            it = challenges_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto it = lastAcceptedStep_.begin(); it != lastAcceptedStep_.end();) {
        if (it->second < oldestLive) {
            it = lastAcceptedStep_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t MfaGate::pendingChallenges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return challenges_.size();
}

ServiceResult<std::string> MfaGate::generateSecret() {
    auto bytes = detail::secureRandomBytes(kSecretLength);
    if (!bytes) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::RandomFailure, "failed to generate MFA secret"));
    }
    auto secret = detail::base32Encode(bytes->data(), bytes->size());
    detail::secureWipe(*bytes);
    return ServiceResult<std::string>::ok(std::move(secret));
}

std::optional<std::string> MfaGate::totpCode(std::string_view secret, TimePoint time,
                                             std::chrono::seconds step) {
    auto key = detail::base32Decode(secret);
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    if (!key || key->empty() || secs < 0 || step.count() <= 0) {
        return std::nullopt;
    }
    auto code = hotp(*key, static_cast<uint64_t>(secs / step.count()));
    detail::secureWipe(*key);
    return code;
}

}  // namespace ssg::service
