#pragma once

/// @file attempt_counter_store.hpp
/// @brief Keyed attempt counters with atomic increment and TTL eviction.
///
/// The rate limiter only talks to IAttemptCounterStore, so the in-memory
/// store can be replaced by one shared between gateway instances without
/// touching the limiter.

#include "ssg/service/auth_types.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ssg::service {

/// Attempt counter for one composite key.
struct RateLimitEntry {
    std::string key;
    uint32_t count = 0;
    TimePoint windowStart{};
};

/// Abstract keyed counter store.
///
/// Implementations must make increment() atomic per key: two concurrent
/// increments of the same key must observe distinct counts.
class IAttemptCounterStore {
public:
    virtual ~IAttemptCounterStore() = default;

    /// Atomically count one attempt for @p key.
    ///
    /// If the key is unknown, or its window started at or before
    /// now - window, the entry restarts at count = 1 with windowStart = now.
    /// Otherwise count is incremented. Returns the entry after the update.
    virtual RateLimitEntry increment(std::string_view key,
                                     std::chrono::seconds window,
                                     TimePoint now) = 0;

    /// Current entry for @p key, if any.
    [[nodiscard]] virtual std::optional<RateLimitEntry> peek(std::string_view key) const = 0;

    /// Forget @p key.
    virtual void reset(std::string_view key) = 0;

    /// Remove entries whose window started before @p cutoff.
    /// Returns the number removed.
    virtual std::size_t evictOlderThan(TimePoint cutoff) = 0;

    /// Number of tracked keys.
    [[nodiscard]] virtual std::size_t size() const = 0;
};

/// Thread-safe in-memory store, sharded by key hash so unrelated keys do
/// not contend on one mutex.
class InMemoryAttemptCounterStore : public IAttemptCounterStore {
public:
    RateLimitEntry increment(std::string_view key,
                             std::chrono::seconds window,
                             TimePoint now) override;

    [[nodiscard]] std::optional<RateLimitEntry> peek(std::string_view key) const override;

    void reset(std::string_view key) override;

    std::size_t evictOlderThan(TimePoint cutoff) override;

    [[nodiscard]] std::size_t size() const override;

private:
    static constexpr std::size_t kShardCount = 16;

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, RateLimitEntry> entries;
    };

    Shard& shardFor(std::string_view key);
    const Shard& shardFor(std::string_view key) const;

    std::array<Shard, kShardCount> shards_;
};

}  // namespace ssg::service
