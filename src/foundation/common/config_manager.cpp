#include "fwr/foundation/config_manager.hpp"

namespace fwr::foundation {

WatchResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return assign(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return WatchResult<void>::err(
            WatchError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return WatchResult<void>::err(
            WatchError(ErrorCode::ConfigLoadFailed,
                       path.string() + ": YAML parse error: " + e.what()));
    } catch (const YAML::Exception& e) {
        return WatchResult<void>::err(
            WatchError(ErrorCode::ConfigLoadFailed, path.string() + ": " + e.what()));
    }
}

WatchResult<void> ConfigManager::loadString(std::string_view document) {
    try {
        return assign(YAML::Load(std::string(document)));
    } catch (const YAML::ParserException& e) {
        return WatchResult<void>::err(
            WatchError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    } catch (const YAML::Exception& e) {
        return WatchResult<void>::err(WatchError(ErrorCode::ConfigLoadFailed, e.what()));
    }
}

WatchResult<YAML::Node> ConfigManager::getNode(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return WatchResult<YAML::Node>::err(
            WatchError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    return WatchResult<YAML::Node>::ok(YAML::Clone(it->second));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

WatchResult<void> ConfigManager::assign(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return WatchResult<void>::err(
            WatchError(ErrorCode::ConfigTypeMismatch, "config root must be a mapping"));
    }
    // Flatten first so that a bad key leaves the previous entries intact.
    std::unordered_map<std::string, YAML::Node> entries;
    if (root.IsMap()) {
        flatten("", root, entries);
    }
    std::lock_guard lock(mutex_);
    entries_ = std::move(entries);
    return WatchResult<void>::ok();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node,
                            std::unordered_map<std::string, YAML::Node>& out) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second, out);
        }
    } else {
        // Leaf node (scalar, sequence, null) stored under its dotted key.
        out[prefix] = YAML::Clone(node);
    }
}

}  // namespace fwr::foundation
