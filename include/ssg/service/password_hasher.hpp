#pragma once

/// @file password_hasher.hpp
/// @brief Salted PBKDF2-HMAC-SHA512 password hashing and verification.
///
/// Stored passwords use the single-string format "hex(salt):hex(derived)"
/// with a 16-byte salt and a 64-byte derived key.

#include "ssg/foundation/service_result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ssg::service {

/// Result of a password hashing operation.
struct HashedPassword {
    std::vector<uint8_t> salt;
    std::vector<uint8_t> derived;

    /// "hex(salt):hex(derived)".
    [[nodiscard]] std::string encoded() const;
};

/// PBKDF2 password hasher.
///
/// Example:
/// @code
///   PasswordHasher hasher;
///   auto hashed = hasher.hash("my_password");
///   if (hashed) {
///       bool ok = hasher.verify("my_password", hashed.value().encoded());
///   }
/// @endcode
class PasswordHasher {
public:
    static constexpr uint32_t kMinIterations = 100000;
    static constexpr std::size_t kSaltLength = 16;
    static constexpr std::size_t kDerivedLength = 64;

    /// Iteration counts below kMinIterations are raised to it.
    explicit PasswordHasher(uint32_t iterations = kMinIterations);

    /// Hash @p password. A missing salt is replaced by kSaltLength fresh
    /// random bytes. Fails only if the RNG or the KDF fails.
    [[nodiscard]] foundation::ServiceResult<HashedPassword> hash(
        std::string_view password,
        std::optional<std::vector<uint8_t>> salt = std::nullopt) const;

    /// Verify @p password against an encoded stored hash.
    /// Malformed stored values verify false. The comparison is constant time.
    [[nodiscard]] bool verify(std::string_view password, std::string_view stored) const;

    [[nodiscard]] uint32_t iterations() const noexcept { return iterations_; }

private:
    [[nodiscard]] bool derive(std::string_view password,
                              const std::vector<uint8_t>& salt,
                              std::vector<uint8_t>& out) const;

    uint32_t iterations_;
};

}  // namespace ssg::service
