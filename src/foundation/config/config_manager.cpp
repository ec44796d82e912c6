/// @file config_manager.cpp
/// @brief ConfigManager implementation (yaml-cpp).

#include "warden/foundation/config_manager.hpp"

#include <set>

namespace warden::foundation {

SecurityResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return SecurityResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return SecurityResult<void>::err(ErrorCode::ConfigLoadFailed,
                                         "failed to open config file: " + path.string());
    } catch (const YAML::ParserException& e) {
        return SecurityResult<void>::err(ErrorCode::ConfigLoadFailed,
                                         std::string("YAML parse error: ") + e.what());
    }
}

SecurityResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return SecurityResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return SecurityResult<void>::err(ErrorCode::ConfigLoadFailed,
                                         std::string("YAML parse error: ") + e.what());
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

bool ConfigManager::isNull(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    return it != entries_.end() && it->second.IsNull();
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::string head = std::string(prefix) + ".";
    std::set<std::string> names;
    for (const auto& [key, _] : entries_) {
        if (key.size() <= head.size() || key.compare(0, head.size(), head) != 0) {
            continue;
        }
        auto rest = key.substr(head.size());
        names.insert(rest.substr(0, rest.find('.')));
    }
    return {names.begin(), names.end()};
}

SecurityResult<YAML::Node> ConfigManager::node(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return SecurityResult<YAML::Node>::err(
            ErrorCode::ConfigKeyNotFound, std::string("config key not found: ") + std::string(key));
    }
    return SecurityResult<YAML::Node>::ok(YAML::Clone(it->second));
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    // Empty maps stay as leaves so `scrypt: {}` still declares a section.
    if (node.IsMap() && node.size() > 0) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

} // namespace warden::foundation
