#pragma once

/// @file ip_blocklist.hpp
/// @brief Time-bounded IP block list fed by automated audit responses.
///
/// Thread-safe with std::shared_mutex for read-heavy workloads; every
/// login consults it, only high-risk audit events write to it.

#include "ssg/service/auth_types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ssg::service {

/// Example:
/// @code
///   IpBlocklist blocklist;
///   blocklist.block("198.51.100.9", now + std::chrono::hours{24});
///   if (blocklist.isBlocked("198.51.100.9", now)) { ... }
/// @endcode
class IpBlocklist {
public:
    /// Block @p ip until @p until. An existing later expiry is kept.
    void block(std::string_view ip, TimePoint until);

    [[nodiscard]] bool isBlocked(std::string_view ip, TimePoint now) const;

    /// Expiry of the block on @p ip, if one is active at @p now.
    [[nodiscard]] std::optional<TimePoint> blockedUntil(std::string_view ip, TimePoint now) const;

    void unblock(std::string_view ip);

    /// Remove expired blocks. Returns the number removed.
    std::size_t cleanup(TimePoint now);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TimePoint> entries_;
};

}  // namespace ssg::service
