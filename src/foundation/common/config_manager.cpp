/// @file config_manager.cpp
/// @brief YAML loading and dotted-key flattening.

#include "pecs/foundation/config_manager.hpp"

namespace pecs::foundation {

namespace {

GameResult<void> parseFailure(const YAML::Exception& e) {
    return GameResult<void>::err(
        GameError(ErrorCode::ConfigLoadFailed, std::string("invalid YAML: ") + e.what()));
}

}  // namespace

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    try {
        return replaceWith(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "cannot read settings file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return parseFailure(e);
    }
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    try {
        return replaceWith(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return parseFailure(e);
    }
}

GameResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    // An empty document is a valid, empty configuration.
    if (root && !root.IsNull() && !root.IsMap()) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "settings root must be a mapping"));
    }
    entries_.clear();
    if (root.IsMap()) {
        addLeaves("", root);
    }
    return GameResult<void>::ok();
}

void ConfigManager::addLeaves(const std::string& prefix, const YAML::Node& node) {
    if (!node.IsMap()) {
        entries_[prefix] = YAML::Clone(node);
        return;
    }
    for (const auto& child : node) {
        const auto name = child.first.as<std::string>();
        addLeaves(prefix.empty() ? name : prefix + "." + name, child.second);
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    return entries_.contains(std::string(key));
}

void ConfigManager::notifyWatchers(std::string_view key) {
    const auto it = watchers_.find(std::string(key));
    if (it == watchers_.end()) {
        return;
    }
    // A watcher may register more watchers for the same key.
    const auto callbacks = it->second;
    for (const auto& callback : callbacks) {
        callback(key);
    }
}

}  // namespace pecs::foundation
