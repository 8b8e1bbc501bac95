#include "ssg/foundation/config_manager.hpp"

#include <algorithm>

#include "ssg/foundation/service_logger.hpp"

namespace ssg::foundation {

ServiceResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return ServiceResult<void>::err(ServiceError(
            ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }

    auto result = replaceWith(root);
    if (result) {
        SSG_LOG_INFO(LogCategory::Config, "loaded configuration from " + path.string());
    }
    return result;
}

ServiceResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return replaceWith(root);
}

ServiceResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    if (!root.IsMap() && !root.IsNull()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, "config root must be a mapping"));
    }
    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
    return ServiceResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keys() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [key, node] : entries_) {
        out.push_back(key);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace ssg::foundation
