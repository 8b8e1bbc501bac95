/// @file session_cipher.cpp
/// @brief SessionCipher implementation over OpenSSL EVP AES-256-GCM.

#include "ssg/service/session_cipher.hpp"

#include "crypto_utils.hpp"
#include "ssg/foundation/service_logger.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace ssg::service {

using foundation::ErrorCode;
using foundation::kGenericAuthFailure;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

ServiceResult<std::string> integrityFailure() {
    return ServiceResult<std::string>::err(
        ServiceError(ErrorCode::IntegrityError, std::string(kGenericAuthFailure)));
}

ServiceResult<std::string> sealFailure(std::string_view step) {
    SSG_LOG_ERROR(LogCategory::Crypto, "session seal failed at " + std::string(step));
    return ServiceResult<std::string>::err(
        ServiceError(ErrorCode::CryptoError, "session seal failed"));
}

}  // namespace

// -- SessionKey ---------------------------------------------------------------

ServiceResult<SessionKey> SessionKey::fromHex(std::string_view hex) {
    auto bytes = detail::fromHex(hex);
    if (!bytes || bytes->size() != kLength) {
        if (bytes) {
            detail::secureWipe(*bytes);
        }
        return ServiceResult<SessionKey>::err(ServiceError(
            ErrorCode::InvalidKey, "session key must be 64 hex characters"));
    }
    SessionKey key;
    std::copy(bytes->begin(), bytes->end(), key.bytes_.begin());
    detail::secureWipe(*bytes);
    return ServiceResult<SessionKey>::ok(key);
}

ServiceResult<SessionKey> SessionKey::generate() {
    SessionKey key;
    if (RAND_bytes(key.bytes_.data(), static_cast<int>(key.bytes_.size())) != 1) {
        return ServiceResult<SessionKey>::err(
            ServiceError(ErrorCode::RandomFailure, "failed to generate session key"));
    }
    return ServiceResult<SessionKey>::ok(key);
}

ServiceResult<std::string> SessionKey::generateHex() {
    auto key = generate();
    if (key.hasError()) {
        return ServiceResult<std::string>::err(std::move(key).error());
    }
    return ServiceResult<std::string>::ok(detail::toHex(key.value().data(), kLength));
}

SessionKey::~SessionKey() {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

// -- SessionCipher ------------------------------------------------------------

SessionCipher::SessionCipher(SessionKey key) : key_(std::move(key)) {}

ServiceResult<std::string> SessionCipher::seal(std::string_view plaintext) const {
    auto nonce = detail::secureRandomBytes(kNonceLength);
    if (!nonce) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::RandomFailure, "failed to generate nonce"));
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return sealFailure("context allocation");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceLength), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce->data()) != 1) {
        return sealFailure("init");
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int total = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          reinterpret_cast<const uint8_t*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        return sealFailure("update");
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
        return sealFailure("final");
    }
    total += len;
    ciphertext.resize(static_cast<std::size_t>(total));

    std::vector<uint8_t> tag(kTagLength);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kTagLength), tag.data()) != 1) {
        return sealFailure("tag");
    }

    std::string token;
    token.reserve((kNonceLength + kTagLength + ciphertext.size()) * 2 + 2);
    token += detail::toHex(*nonce);
    token += kDelimiter;
    token += detail::toHex(tag);
    token += kDelimiter;
    token += detail::toHex(ciphertext);
    return ServiceResult<std::string>::ok(std::move(token));
}

ServiceResult<std::string> SessionCipher::open(std::string_view token) const {
    auto first = token.find(kDelimiter);
    if (first == std::string_view::npos) {
        return integrityFailure();
    }
    auto second = token.find(kDelimiter, first + 1);
    if (second == std::string_view::npos ||
        token.find(kDelimiter, second + 1) != std::string_view::npos) {
        return integrityFailure();
    }

    auto nonce = detail::fromHex(token.substr(0, first));
    auto tag = detail::fromHex(token.substr(first + 1, second - first - 1));
    auto ciphertext = detail::fromHex(token.substr(second + 1));
    if (!nonce || !tag || !ciphertext || nonce->size() != kNonceLength ||
        tag->size() != kTagLength) {
        return integrityFailure();
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return integrityFailure();
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceLength), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce->data()) != 1) {
        return integrityFailure();
    }

    std::vector<uint8_t> plaintext(ciphertext->size() + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int total = 0;
    if (!ciphertext->empty() &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext->data(),
                          static_cast<int>(ciphertext->size())) != 1) {
        return integrityFailure();
    }
    total = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kTagLength), tag->data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        detail::secureWipe(plaintext);
        return integrityFailure();
    }
    total += len;

    std::string result(reinterpret_cast<const char*>(plaintext.data()),
                       static_cast<std::size_t>(total));
    detail::secureWipe(plaintext);
    return ServiceResult<std::string>::ok(std::move(result));
}

}  // namespace ssg::service
