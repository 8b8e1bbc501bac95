/// @file attempt_counter_store.cpp
/// @brief InMemoryAttemptCounterStore implementation.

#include "ssg/service/attempt_counter_store.hpp"

#include <functional>

namespace ssg::service {

InMemoryAttemptCounterStore::Shard& InMemoryAttemptCounterStore::shardFor(std::string_view key) {
    return shards_[std::hash<std::string_view>{}(key) % kShardCount];
}

const InMemoryAttemptCounterStore::Shard& InMemoryAttemptCounterStore::shardFor(
    std::string_view key) const {
    return shards_[std::hash<std::string_view>{}(key) % kShardCount];
}

RateLimitEntry InMemoryAttemptCounterStore::increment(std::string_view key,
                                                      std::chrono::seconds window,
                                                      TimePoint now) {
    auto& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto [it, inserted] = shard.entries.try_emplace(std::string(key));
    auto& entry = it->second;
    if (inserted || now - entry.windowStart >= window) {
        entry.key = std::string(key);
        entry.count = 1;
        entry.windowStart = now;
    } else {
        ++entry.count;
    }
    return entry;
}

std::optional<RateLimitEntry> InMemoryAttemptCounterStore::peek(std::string_view key) const {
    const auto& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(std::string(key));
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryAttemptCounterStore::reset(std::string_view key) {
    auto& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.entries.erase(std::string(key));
}

std::size_t InMemoryAttemptCounterStore::evictOlderThan(TimePoint cutoff) {
    std::size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            if (it->second.windowStart < cutoff) {
                it = shard.entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

std::size_t InMemoryAttemptCounterStore::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

}  // namespace ssg::service
