#pragma once

/// @file session_cipher.hpp
/// @brief AES-256-GCM sealing of session context blobs.
///
/// Token wire format: hex(nonce) ":" hex(tag) ":" hex(ciphertext), with a
/// 12-byte nonce drawn from the CSPRNG on every seal and a 16-byte tag.

#include "ssg/foundation/service_result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ssg::service {

/// 256-bit session key. Immutable after construction and wiped on
/// destruction. No accessor renders a loaded key as text.
class SessionKey {
public:
    static constexpr std::size_t kLength = 32;

    /// Parse a 64-character hex key.
    [[nodiscard]] static foundation::ServiceResult<SessionKey> fromHex(std::string_view hex);

    /// Fresh random key from the CSPRNG.
    [[nodiscard]] static foundation::ServiceResult<SessionKey> generate();

    /// Fresh random key as 64 hex characters, accepted by fromHex().
    /// Used to provision session.encryption_key.
    [[nodiscard]] static foundation::ServiceResult<std::string> generateHex();

    SessionKey(const SessionKey&) = default;
    SessionKey& operator=(const SessionKey&) = default;
    ~SessionKey();

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }

private:
    SessionKey() = default;

    std::array<uint8_t, kLength> bytes_{};
};

/// Authenticated encryption of opaque session blobs.
///
/// open() reports every failure (malformed field, wrong length, tag
/// mismatch, wrong key) as the same IntegrityError with the same message.
///
/// Example:
/// @code
///   auto key = SessionKey::generate();
///   SessionCipher cipher(key.value());
///   auto token = cipher.seal(R"({"user_id":"u1"})");
///   auto plain = cipher.open(token.value());
/// @endcode
class SessionCipher {
public:
    static constexpr std::size_t kNonceLength = 12;
    static constexpr std::size_t kTagLength = 16;
    static constexpr char kDelimiter = ':';

    explicit SessionCipher(SessionKey key);

    /// Encrypt @p plaintext under a fresh random nonce.
    [[nodiscard]] foundation::ServiceResult<std::string> seal(std::string_view plaintext) const;

    /// Decrypt and authenticate a token produced by seal().
    [[nodiscard]] foundation::ServiceResult<std::string> open(std::string_view token) const;

private:
    SessionKey key_;
};

}  // namespace ssg::service
