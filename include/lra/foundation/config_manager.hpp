#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed configuration with dotted-key typed access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "lra/foundation/agent_result.hpp"

namespace lra::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration manager.
///
/// Loads a file or an in-memory document, flattens it into dotted keys
/// (e.g. "resilience.retry.max_retries") and offers typed lookups.
///
/// Example:
/// @code
///   ConfigManager config;
///   if (auto loaded = config.load("agent.yaml"); !loaded) {
///       return loaded.error();
///   }
///   auto rpm = config.get<int>("resilience.rate_limit.requests_per_minute");
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    AgentResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    AgentResult<void> loadFromString(std::string_view yaml);

    /// Typed lookup by dotted key.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    AgentResult<T> get(std::string_view key) const;

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    AgentResult<void> replaceWith(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
AgentResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return AgentResult<T>::err(
            AgentError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    try {
        return AgentResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return AgentResult<T>::err(
            AgentError(ErrorCode::ConfigTypeMismatch,
                       std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace lra::foundation
