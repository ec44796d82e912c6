#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with dotted-key typed access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "warden/foundation/security_result.hpp"

namespace warden::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration flattened into dotted keys ("session.idle_timeout").
///
/// Maps are flattened recursively; scalars, sequences and nulls are stored
/// as leaves. An explicit YAML null is kept so that callers can tell
/// "disabled" (`cache.backend: ~`) from "absent".
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    SecurityResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    SecurityResult<void> loadFromString(std::string_view yaml);

    /// Typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch.
    template <typename T>
    SecurityResult<T> get(std::string_view key) const;

    /// Typed value, or @p fallback when the key is absent.
    /// A present key of the wrong type is still an error.
    template <typename T>
    SecurityResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// True when the key exists and holds an explicit YAML null.
    [[nodiscard]] bool isNull(std::string_view key) const;

    /// Distinct immediate child names under @p prefix, sorted.
    /// childKeys("authc.hash_algorithms") -> {"pbkdf2_sha256", "scrypt"}.
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

    /// Raw node for sequence-valued keys such as "realms".
    SecurityResult<YAML::Node> node(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
SecurityResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return SecurityResult<T>::err(ErrorCode::ConfigKeyNotFound,
                                      std::string("config key not found: ") + std::string(key));
    }
    try {
        return SecurityResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return SecurityResult<T>::err(ErrorCode::ConfigTypeMismatch,
                                      std::string("type mismatch for key: ") + std::string(key));
    }
}

template <typename T>
SecurityResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return SecurityResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace warden::foundation
