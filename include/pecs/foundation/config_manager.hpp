#pragma once

/// @file config_manager.hpp
/// @brief Flattened YAML settings store used to build a WorldConfig.

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "pecs/foundation/game_result.hpp"

namespace pecs::foundation {

/// Called with the key whose value set() just replaced.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Settings read from a YAML document.
///
/// Nested mappings are flattened into dotted keys on load, so
/// @code
///   world:
///     spatial:
///       cellSize: 64
/// @endcode
/// is read back as `get<double>("world.spatial.cellSize")`.  Sequences
/// and scalars are leaves.  Each leaf is stored as a cloned node, so no
/// two entries share yaml-cpp node memory.
///
/// Not thread-safe.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Replace all entries with the contents of @p path.
    /// @return ConfigLoadFailed if the file is missing, unparsable, or its
    ///         root is not a mapping.
    GameResult<void> load(const std::filesystem::path& path);

    /// Replace all entries with the document in @p yaml.
    GameResult<void> loadFromString(std::string_view yaml);

    /// @return ConfigKeyNotFound or ConfigTypeMismatch on failure.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// get() with @p fallback for an absent key.  A present key of the
    /// wrong type is still ConfigTypeMismatch.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    /// Store @p value under @p key, then run that key's watchers.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    GameResult<void> replaceWith(const YAML::Node& root);
    void addLeaves(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    const auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound, "no such setting: " + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      "setting has the wrong type: " + std::string(key)));
    }
}

template <typename T>
GameResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    entries_[std::string(key)] = YAML::Node(value);
    notifyWatchers(key);
}

}  // namespace pecs::foundation
