#pragma once

/// @file rate_limiter.hpp
/// @brief Fixed-window rate limiter for login attempt throttling.
///
/// Counts attempts per composite key within a window. Attempt storage is
/// delegated to an IAttemptCounterStore so that several gateway instances
/// can share one counter store.

#include "ssg/service/attempt_counter_store.hpp"
#include "ssg/service/auth_types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ssg::service {

/// Named limit applied to a family of keys.
struct RateLimitPolicy {
    /// Key prefix, e.g. "auth" produces "auth:<ip>:<identifier>".
    std::string name;

    uint32_t maxAttempts = 5;
    std::chrono::seconds window{900};

    /// Append the login identifier to the key.
    bool perIdentifier = true;

    /// Entries idle for window * evictionMultiplier are dropped.
    uint32_t evictionMultiplier = 2;

    /// Login throttling: 5 attempts per 15 minutes per (ip, identifier).
    static RateLimitPolicy login();

    /// Flood protection: 100 requests per minute per ip.
    static RateLimitPolicy ddos();

    /// API throttling: 1000 requests per 15 minutes per ip.
    static RateLimitPolicy api();
};

/// Outcome of one counted attempt.
struct RateLimitDecision {
    bool allowed = false;
    uint32_t remaining = 0;
    uint32_t attempts = 0;
    TimePoint resetAt{};

    /// Whole seconds until resetAt (rounded up, never negative).
    [[nodiscard]] std::chrono::seconds retryAfter(TimePoint now) const;
};

/// Fixed-window rate limiter.
///
/// Example:
/// @code
///   RateLimiter limiter(RateLimitPolicy::login());
///   auto decision = limiter.check(limiter.keyFor("203.0.113.7", "alice@example.com"));
///   if (!decision.allowed) {
///       // reject; decision.retryAfter(now) seconds until the window resets
///   }
/// @endcode
class RateLimiter {
public:
    /// Construct with a policy. A null store selects InMemoryAttemptCounterStore.
    explicit RateLimiter(RateLimitPolicy policy,
                         std::shared_ptr<IAttemptCounterStore> store = nullptr);

    /// Count one attempt for @p key and decide whether it is admitted.
    ///
    /// The first attempt in a window (or the first after the window
    /// elapsed) restarts the count at 1. Attempt n is admitted iff
    /// n <= maxAttempts. The count is updated atomically in the store.
    [[nodiscard]] RateLimitDecision check(std::string_view key,
                                          TimePoint now = std::chrono::system_clock::now());

    /// Composite key for this policy. An empty identifier maps to "unknown"
    /// so that probing without a known identity is still bounded per ip.
    [[nodiscard]] std::string keyFor(std::string_view ip, std::string_view identifier = {}) const;

    /// Attempts left in the current window without counting one.
    [[nodiscard]] uint32_t remaining(std::string_view key,
                                     TimePoint now = std::chrono::system_clock::now()) const;

    void reset(std::string_view key);

    /// Drop entries older than window * evictionMultiplier.
    /// Returns the number removed.
    std::size_t evictStale(TimePoint now = std::chrono::system_clock::now());

    [[nodiscard]] std::size_t trackedKeys() const;

    [[nodiscard]] const RateLimitPolicy& policy() const noexcept { return policy_; }

private:
    void maybeSweep(TimePoint now);

    RateLimitPolicy policy_;
    std::shared_ptr<IAttemptCounterStore> store_;
    std::atomic<int64_t> lastSweepTicks_{0};
};

} // namespace ssg::service
