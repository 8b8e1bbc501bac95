#pragma once

/// @file crypto_utils.hpp
/// @brief Internal encoding and randomness helpers shared by the password
/// hasher, session cipher and MFA gate.
///
/// Randomness and constant-time comparison are delegated to OpenSSL.

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ssg::service::detail {

// =============================================================================
// Hex encoding
// =============================================================================

/// Encode bytes to lowercase hex string.
[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

[[nodiscard]] inline std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

/// Decode a hex string (either case). Returns nullopt on odd length or a
/// non-hex character.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> fromHex(std::string_view hex) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    };

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

// =============================================================================
// Base32 (RFC 4648, no padding), used for TOTP secrets
// =============================================================================

[[nodiscard]] inline std::string base32Encode(const uint8_t* data, std::size_t length) {
    static constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    std::string out;
    out.reserve((length * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (std::size_t i = 0; i < length; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(alphabet[(buffer >> bits) & 0x1F]);
        }
    }
    if (bits > 0) {
        out.push_back(alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

/// Decode base32, case-insensitive, ignoring spaces and trailing '='.
/// Returns nullopt on any other character.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> base32Decode(std::string_view input) {
    std::vector<uint8_t> out;
    out.reserve(input.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : input) {
        if (c == '=') {
            break;
        }
        if (c == ' ') {
            continue;
        }
        int val = -1;
        if (c >= 'A' && c <= 'Z') {
            val = c - 'A';
        } else if (c >= 'a' && c <= 'z') {
            val = c - 'a';
        } else if (c >= '2' && c <= '7') {
            val = 26 + (c - '2');
        }
        if (val < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(val);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

// =============================================================================
// Secure random generation
// =============================================================================

/// Fill @p numBytes from the OpenSSL CSPRNG. Returns nullopt if the
/// generator is not seeded or fails.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> secureRandomBytes(std::size_t numBytes) {
    std::vector<uint8_t> buf(numBytes);
    if (numBytes > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return std::nullopt;
    }
    return buf;
}

/// @p numBytes random bytes, hex-encoded; empty string on generator failure.
[[nodiscard]] inline std::string secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    return bytes ? toHex(*bytes) : std::string{};
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Compare two byte ranges without early exit on the first difference.
/// Only the lengths are compared in variable time.
[[nodiscard]] inline bool constantTimeEqual(const uint8_t* a, std::size_t aLen,
                                            const uint8_t* b, std::size_t bLen) {
    if (aLen != bLen) {
        return false;
    }
    return aLen == 0 || CRYPTO_memcmp(a, b, aLen) == 0;
}

[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    return constantTimeEqual(reinterpret_cast<const uint8_t*>(a.data()), a.size(),
                             reinterpret_cast<const uint8_t*>(b.data()), b.size());
}

/// Overwrite a buffer holding secret material.
inline void secureWipe(std::vector<uint8_t>& buf) {
    if (!buf.empty()) {
        OPENSSL_cleanse(buf.data(), buf.size());
    }
}

}  // namespace ssg::service::detail
