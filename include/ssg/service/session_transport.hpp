#pragma once

/// @file session_transport.hpp
/// @brief Request-scoped cookie transport for the sealed session token.
///
/// Keeps the orchestrator free of any HTTP framework types. An adapter
/// implements ISessionTransport over its own request and response objects.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ssg::service {

enum class SameSite : uint8_t { Strict, Lax, None };

[[nodiscard]] constexpr std::string_view toString(SameSite value) {
    switch (value) {
        case SameSite::Strict: return "Strict";
        case SameSite::Lax:    return "Lax";
        case SameSite::None:   return "None";
    }
    return "Strict";
}

/// Attributes applied when a cookie is written.
struct CookieOptions {
    bool httpOnly = true;
    bool secure = true;
    SameSite sameSite = SameSite::Strict;
    std::chrono::seconds maxAge{8 * 60 * 60};
    std::string path = "/";
};

/// Render a Set-Cookie header value.
[[nodiscard]] std::string formatSetCookie(std::string_view name, std::string_view value,
                                          const CookieOptions& options);

/// Cookie access for one inbound request.
class ISessionTransport {
public:
    virtual ~ISessionTransport() = default;

    [[nodiscard]] virtual std::optional<std::string> get(std::string_view name) const = 0;

    virtual void set(std::string_view name, std::string value, const CookieOptions& options) = 0;

    virtual void remove(std::string_view name) = 0;
};

/// Cookie jar that remembers attributes; used by tests and the CLI.
class InMemorySessionTransport : public ISessionTransport {
public:
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const override;

    void set(std::string_view name, std::string value, const CookieOptions& options) override;

    void remove(std::string_view name) override;

    /// Attributes of the last set() for @p name, if the cookie is present.
    [[nodiscard]] std::optional<CookieOptions> options(std::string_view name) const;

    /// Set-Cookie header for @p name, if the cookie is present.
    [[nodiscard]] std::optional<std::string> setCookieHeader(std::string_view name) const;

private:
    struct Cookie {
        std::string value;
        CookieOptions options;
    };

    std::map<std::string, Cookie, std::less<>> cookies_;
};

}  // namespace ssg::service
