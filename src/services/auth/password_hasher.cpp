/// @file password_hasher.cpp
/// @brief PasswordHasher implementation using OpenSSL PKCS5_PBKDF2_HMAC.

#include "ssg/service/password_hasher.hpp"

#include "crypto_utils.hpp"
#include "ssg/foundation/service_logger.hpp"

#include <openssl/evp.h>

#include <algorithm>

namespace ssg::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

std::string HashedPassword::encoded() const {
    return detail::toHex(salt) + ":" + detail::toHex(derived);
}

PasswordHasher::PasswordHasher(uint32_t iterations)
    : iterations_(std::max(iterations, kMinIterations)) {}

bool PasswordHasher::derive(std::string_view password,
                            const std::vector<uint8_t>& salt,
                            std::vector<uint8_t>& out) const {
    out.assign(kDerivedLength, 0);
    int rc = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                               salt.data(), static_cast<int>(salt.size()),
                               static_cast<int>(iterations_), EVP_sha512(),
                               static_cast<int>(out.size()), out.data());
    return rc == 1;
}

ServiceResult<HashedPassword> PasswordHasher::hash(
    std::string_view password, std::optional<std::vector<uint8_t>> salt) const {
    HashedPassword result;
    if (salt) {
        result.salt = std::move(*salt);
    } else {
        auto fresh = detail::secureRandomBytes(kSaltLength);
        if (!fresh) {
            return ServiceResult<HashedPassword>::err(
                ServiceError(ErrorCode::RandomFailure, "failed to generate password salt"));
        }
        result.salt = std::move(*fresh);
    }

    if (!derive(password, result.salt, result.derived)) {
        SSG_LOG_ERROR(LogCategory::Crypto, "PBKDF2 derivation failed");
        return ServiceResult<HashedPassword>::err(
            ServiceError(ErrorCode::CryptoError, "password derivation failed"));
    }
    return ServiceResult<HashedPassword>::ok(std::move(result));
}

bool PasswordHasher::verify(std::string_view password, std::string_view stored) const {
    auto sep = stored.find(':');
    if (sep == std::string_view::npos) {
        return false;
    }
    auto salt = detail::fromHex(stored.substr(0, sep));
    auto expected = detail::fromHex(stored.substr(sep + 1));
    if (!salt || !expected || salt->empty() || expected->size() != kDerivedLength) {
        return false;
    }

    std::vector<uint8_t> computed;
    if (!derive(password, *salt, computed)) {
        SSG_LOG_ERROR(LogCategory::Crypto, "PBKDF2 derivation failed during verify");
        return false;
    }
    bool match = detail::constantTimeEqual(computed.data(), computed.size(),
                                           expected->data(), expected->size());
    detail::secureWipe(computed);
    return match;
}

}  // namespace ssg::service
