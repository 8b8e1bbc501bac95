/// @file session_transport.cpp
/// @brief Set-Cookie rendering and InMemorySessionTransport.

#include "ssg/service/session_transport.hpp"

namespace ssg::service {

std::string formatSetCookie(std::string_view name, std::string_view value,
                            const CookieOptions& options) {
    std::string header;
    header.reserve(name.size() + value.size() + 64);
    header += name;
    header += '=';
    header += value;
    header += "; Max-Age=" + std::to_string(options.maxAge.count());
    if (!options.path.empty()) {
        header += "; Path=" + options.path;
    }
    if (options.httpOnly) {
        header += "; HttpOnly";
    }
    if (options.secure) {
        header += "; Secure";
    }
    header += "; SameSite=";
    header += toString(options.sameSite);
    return header;
}

std::optional<std::string> InMemorySessionTransport::get(std::string_view name) const {
    auto it = cookies_.find(name);
    if (it == cookies_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

void InMemorySessionTransport::set(std::string_view name, std::string value,
                                   const CookieOptions& options) {
    cookies_.insert_or_assign(std::string(name), Cookie{std::move(value), options});
}

void InMemorySessionTransport::remove(std::string_view name) {
    auto it = cookies_.find(name);
    if (it != cookies_.end()) {
        cookies_.erase(it);
    }
}

std::optional<CookieOptions> InMemorySessionTransport::options(std::string_view name) const {
    auto it = cookies_.find(name);
    if (it == cookies_.end()) {
        return std::nullopt;
    }
    return it->second.options;
}

std::optional<std::string> InMemorySessionTransport::setCookieHeader(std::string_view name) const {
    auto it = cookies_.find(name);
    if (it == cookies_.end()) {
        return std::nullopt;
    }
    return formatSetCookie(name, it->second.value, it->second.options);
}

}  // namespace ssg::service
