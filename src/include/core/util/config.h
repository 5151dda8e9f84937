/*
    config.h
    This header provides functionality for managing application configuration
    using TOML files. It includes utilities for reading and writing general
    configuration values as well as the transfer and history settings.

    Example usage:

    General configuration:
    - Read a value from the general config:
        T value = puresend::core::config["key"].value_or(default_value);

    Application settings:
    - Read a setting:
        bool record = puresend::core::settings.record_history;
        std::uint32_t days = puresend::core::settings.retention_days;
    - Write a setting:
        puresend::core::settings.hide_peer_address = true;
        puresend::core::settings.cleanup_strategy = CleanupStrategy::kByCount;

    Initialization and saving:
    - Initialize the configuration (loads from file or creates default):
        puresend::core::InitConfig();
    - Save the current configuration to file:
        puresend::core::SaveConfig();
    Both take the config file path, path::kConfigFile by default.
*/

#pragma once

#include <core/constant/path.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <toml++/toml.h>

namespace puresend::core {

inline toml::table config;

enum class OverwritePolicy {
    kRename,
    kOverwrite,
    kSkip,
};

enum class CleanupStrategy {
    kDisabled,
    kByTime,
    kByCount,
};

std::string_view OverwritePolicyToString(OverwritePolicy policy);
std::optional<OverwritePolicy> OverwritePolicyFromString(std::string_view value);
std::string_view CleanupStrategyToString(CleanupStrategy strategy);
std::optional<CleanupStrategy> CleanupStrategyFromString(std::string_view value);

struct Settings {
    // [transfer]
    std::filesystem::path receive_dir; // Directory for files pushed through the relay upload server
    bool auto_accept;                  // Accept relay requests without asking
    OverwritePolicy file_overwrite;
    std::size_t record_cache_capacity;

    // [history]
    bool record_history;
    bool hide_peer_address; // Privacy mode: keep addresses out of the history file
    CleanupStrategy cleanup_strategy;
    std::uint32_t retention_days;
    std::size_t max_count;         // used by CleanupStrategy::kByCount
    std::size_t max_history_count; // hard cap, applied on every append
};

inline Settings settings;

// Fills every field, falling back to defaults for missing or malformed keys
Settings ParseSettings(const toml::table& table);

toml::table SettingsToTable(const Settings& value);

void InitConfig(const std::filesystem::path& file = path::kConfigFile);

// Writes `settings` back into `config` and the file; false if the file can't be written
bool SaveConfig(const std::filesystem::path& file = path::kConfigFile);

} // namespace puresend::core
