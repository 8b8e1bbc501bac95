#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "ssg/foundation/service_result.hpp"

namespace ssg::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g. "rate_limit.max_attempts") and runtime overrides via set().
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
///
/// Example:
/// @code
///   ConfigManager config;
///   auto loaded = config.load("/etc/ssg/gateway.yaml");
///   auto window = config.getOr<int>("rate_limit.window_seconds", 900);
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    ServiceResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    ServiceResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    ServiceResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back to @p fallback when the key is
    /// missing. A present but mistyped value still yields the fallback; use
    /// get() where the distinction matters.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All flattened keys, sorted.
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    ServiceResult<void> replaceWith(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
ServiceResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end() || it->second.IsNull()) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ServiceResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
T ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasValue()) {
        return std::move(result).value();
    }
    return fallback;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace ssg::foundation
