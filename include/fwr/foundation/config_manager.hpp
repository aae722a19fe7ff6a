#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "fwr/foundation/watch_result.hpp"

namespace fwr::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g. "dispatch.timeout_seconds") and runtime overrides via set().
///
/// Maps are flattened into a key-value table; sequences such as the
/// `commands` list stay whole and are retrieved with getNode().
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing the current entries.
    /// @return Success or ConfigLoadFailed error.
    WatchResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    WatchResult<void> loadString(std::string_view document);

    /// Retrieve a typed scalar by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    WatchResult<T> get(std::string_view key) const;

    /// Retrieve a typed scalar, falling back to @p fallback when the key is
    /// absent. A present key of the wrong type is still an error.
    template <typename T>
    WatchResult<T> getOr(std::string_view key, T fallback) const;

    /// Retrieve the raw node stored under a dotted key (deep copy).
    WatchResult<YAML::Node> getNode(std::string_view key) const;

    /// Override a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    WatchResult<void> assign(const YAML::Node& root);

    /// Flatten a YAML node recursively into @p out.
    /// Throws YAML::BadConversion for a non-scalar mapping key.
    static void flatten(const std::string& prefix, const YAML::Node& node,
                        std::unordered_map<std::string, YAML::Node>& out);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
WatchResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return WatchResult<T>::err(
            WatchError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    try {
        return WatchResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return WatchResult<T>::err(
            WatchError(ErrorCode::ConfigTypeMismatch,
                       std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
WatchResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return WatchResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace fwr::foundation
