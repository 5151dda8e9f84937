#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <system_error>

namespace puresend::core {

std::string_view OverwritePolicyToString(OverwritePolicy policy) {
    switch (policy) {
    case OverwritePolicy::kRename:
        return "rename";
    case OverwritePolicy::kOverwrite:
        return "overwrite";
    case OverwritePolicy::kSkip:
        return "skip";
    }
    return "rename";
}

std::optional<OverwritePolicy> OverwritePolicyFromString(std::string_view value) {
    if (value == "rename") {
        return OverwritePolicy::kRename;
    }
    if (value == "overwrite") {
        return OverwritePolicy::kOverwrite;
    }
    if (value == "skip") {
        return OverwritePolicy::kSkip;
    }
    return std::nullopt;
}

std::string_view CleanupStrategyToString(CleanupStrategy strategy) {
    switch (strategy) {
    case CleanupStrategy::kDisabled:
        return "disabled";
    case CleanupStrategy::kByTime:
        return "by-time";
    case CleanupStrategy::kByCount:
        return "by-count";
    }
    return "disabled";
}

std::optional<CleanupStrategy> CleanupStrategyFromString(std::string_view value) {
    if (value == "disabled") {
        return CleanupStrategy::kDisabled;
    }
    if (value == "by-time") {
        return CleanupStrategy::kByTime;
    }
    if (value == "by-count") {
        return CleanupStrategy::kByCount;
    }
    return std::nullopt;
}

static std::size_t readCount(const toml::node_view<const toml::node>& node, std::size_t fallback) {
    auto value = node.value<std::int64_t>();
    if (!value || *value <= 0) {
        return fallback;
    }
    return static_cast<std::size_t>(*value);
}

Settings ParseSettings(const toml::table& table) {
    Settings result;

    auto transfer = table["transfer"];
    result.receive_dir = transfer["receive-dir"].value_or(path::kDefaultReceiveDir.string());
    result.auto_accept = transfer["auto-accept"].value_or(false);
    auto overwrite = transfer["file-overwrite"].value_or(std::string{"rename"});
    if (auto policy = OverwritePolicyFromString(overwrite); policy) {
        result.file_overwrite = *policy;
    } else {
        spdlog::warn("Unknown file-overwrite policy \"{}\", using \"rename\"", overwrite);
        result.file_overwrite = OverwritePolicy::kRename;
    }
    result.record_cache_capacity = readCount(transfer["record-cache-capacity"],
                                             transfer::kDefaultRecordCacheCapacity);

    auto history = table["history"];
    result.record_history = history["record-history"].value_or(true);
    result.hide_peer_address = history["hide-peer-address"].value_or(false);
    auto strategy = history["cleanup-strategy"].value_or(std::string{"disabled"});
    if (auto parsed = CleanupStrategyFromString(strategy); parsed) {
        result.cleanup_strategy = *parsed;
    } else {
        spdlog::warn("Unknown cleanup-strategy \"{}\", cleanup disabled", strategy);
        result.cleanup_strategy = CleanupStrategy::kDisabled;
    }
    result.retention_days = static_cast<std::uint32_t>(readCount(history["retention-days"], 30));
    result.max_count = readCount(history["max-count"], 500);
    result.max_history_count = readCount(history["max-history-count"],
                                         transfer::kDefaultMaxHistoryCount);
    return result;
}

toml::table SettingsToTable(const Settings& value) {
    return toml::table{
        {"transfer",
         toml::table{
             {"receive-dir", value.receive_dir.string()},
             {"auto-accept", value.auto_accept},
             {"file-overwrite", std::string(OverwritePolicyToString(value.file_overwrite))},
             {"record-cache-capacity", static_cast<std::int64_t>(value.record_cache_capacity)},
         }},
        {"history",
         toml::table{
             {"record-history", value.record_history},
             {"hide-peer-address", value.hide_peer_address},
             {"cleanup-strategy", std::string(CleanupStrategyToString(value.cleanup_strategy))},
             {"retention-days", static_cast<std::int64_t>(value.retention_days)},
             {"max-count", static_cast<std::int64_t>(value.max_count)},
             {"max-history-count", static_cast<std::int64_t>(value.max_history_count)},
         }},
    };
}

void InitConfig(const std::filesystem::path& file) {
    std::error_code ec;
    if (file.has_parent_path() && !std::filesystem::exists(file.parent_path(), ec)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create \"{}\": {}", file.parent_path().string(), ec.message());
        }
    }
    if (!std::filesystem::exists(file, ec)) {
        std::ofstream ofs(file);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(file.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be opened for parsing: {}", file.string(), err.description());
        config = toml::table{};
    }

    settings = ParseSettings(config);
}

bool SaveConfig(const std::filesystem::path& file) {
    auto table = SettingsToTable(settings);
    config.insert_or_assign("transfer", *table["transfer"].as_table());
    config.insert_or_assign("history", *table["history"].as_table());

    std::ofstream ofs(file, std::ios::trunc);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", file.string());
        return false;
    }
    ofs << config << '\n';
    ofs.flush();
    if (!ofs) {
        spdlog::error("Failed to write \"{}\".", file.string());
        return false;
    }
    return true;
}

} // namespace puresend::core
