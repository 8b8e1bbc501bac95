/// @file rate_limiter.cpp
/// @brief Fixed-window RateLimiter implementation.

#include "ssg/service/rate_limiter.hpp"

#include "ssg/foundation/service_logger.hpp"

namespace ssg::service {

using foundation::LogCategory;

RateLimitPolicy RateLimitPolicy::login() {
    return {"auth", 5, std::chrono::minutes{15}, true, 2};
}

RateLimitPolicy RateLimitPolicy::ddos() {
    return {"ddos", 100, std::chrono::minutes{1}, false, 2};
}

RateLimitPolicy RateLimitPolicy::api() {
    return {"api", 1000, std::chrono::minutes{15}, false, 2};
}

std::chrono::seconds RateLimitDecision::retryAfter(TimePoint now) const {
    if (resetAt <= now) {
        return std::chrono::seconds{0};
    }
    return std::chrono::ceil<std::chrono::seconds>(resetAt - now);
}

RateLimiter::RateLimiter(RateLimitPolicy policy, std::shared_ptr<IAttemptCounterStore> store)
    : policy_(std::move(policy)),
      store_(store ? std::move(store) : std::make_shared<InMemoryAttemptCounterStore>()) {}

RateLimitDecision RateLimiter::check(std::string_view key, TimePoint now) {
    maybeSweep(now);

    auto entry = store_->increment(key, policy_.window, now);

    RateLimitDecision decision;
    decision.attempts = entry.count;
    decision.allowed = entry.count <= policy_.maxAttempts;
    decision.remaining = decision.allowed ? policy_.maxAttempts - entry.count : 0;
    decision.resetAt = entry.windowStart + policy_.window;

    if (!decision.allowed && entry.count == policy_.maxAttempts + 1) {
        SSG_LOG_WARN(LogCategory::RateLimit,
                     "policy '" + policy_.name + "' exhausted for a key; denying until window reset");
    }
    return decision;
}

std::string RateLimiter::keyFor(std::string_view ip, std::string_view identifier) const {
    std::string key;
    key.reserve(policy_.name.size() + ip.size() + identifier.size() + 10);
    key += policy_.name;
    key += ':';
    key += ip;
    if (policy_.perIdentifier) {
        key += ':';
        key += identifier.empty() ? std::string_view("unknown") : identifier;
    }
    return key;
}

uint32_t RateLimiter::remaining(std::string_view key, TimePoint now) const {
    auto entry = store_->peek(key);
    if (!entry || now - entry->windowStart >= policy_.window) {
        return policy_.maxAttempts;
    }
    return entry->count >= policy_.maxAttempts ? 0u : policy_.maxAttempts - entry->count;
}

void RateLimiter::reset(std::string_view key) {
    store_->reset(key);
}

std::size_t RateLimiter::evictStale(TimePoint now) {
    auto cutoff = now - policy_.window * policy_.evictionMultiplier;
    auto removed = store_->evictOlderThan(cutoff);
    if (removed > 0) {
        SSG_LOG_DEBUG(LogCategory::RateLimit,
                      "evicted " + std::to_string(removed) + " stale '" + policy_.name + "' entries");
    }
    return removed;
}

std::size_t RateLimiter::trackedKeys() const {
    return store_->size();
}

// Sweeps run at most once per window; the CAS elects a single sweeper
// among concurrent callers.
void RateLimiter::maybeSweep(TimePoint now) {
    auto nowTicks = now.time_since_epoch().count();
    auto last = lastSweepTicks_.load(std::memory_order_relaxed);
    auto interval = std::chrono::duration_cast<TimePoint::duration>(policy_.window).count();
    if (last != 0 && nowTicks - last < interval) {
        return;
    }
    if (lastSweepTicks_.compare_exchange_strong(last, nowTicks, std::memory_order_acq_rel)) {
        evictStale(now);
    }
}

}  // namespace ssg::service
