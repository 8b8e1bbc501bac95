/// @file ip_blocklist.cpp
/// @brief IpBlocklist implementation.

#include "ssg/service/ip_blocklist.hpp"

#include <mutex>

namespace ssg::service {

void IpBlocklist::block(std::string_view ip, TimePoint until) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(std::string(ip), until);
    if (!inserted && it->second < until) {
        it->second = until;
    }
}

bool IpBlocklist::isBlocked(std::string_view ip, TimePoint now) const {
    return blockedUntil(ip, now).has_value();
}

std::optional<TimePoint> IpBlocklist::blockedUntil(std::string_view ip, TimePoint now) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(std::string(ip));
    if (it == entries_.end() || it->second <= now) {
        return std::nullopt;
    }
    return it->second;
}

void IpBlocklist::unblock(std::string_view ip) {
    std::unique_lock lock(mutex_);
    entries_.erase(std::string(ip));
}

std::size_t IpBlocklist::cleanup(TimePoint now) {
    std::unique_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second <= now) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t IpBlocklist::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace ssg::service
