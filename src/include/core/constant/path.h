#pragma once

#include <cstdlib>
#include <filesystem>

namespace puresend::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "PureSend"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("APPDATA")) / "PureSend";
#else
    std::filesystem::path(std::getenv("HOME")) / ".config" / "PureSend";
#endif

inline const std::filesystem::path kConfigFile = kConfigDir / "config.toml";

inline const std::filesystem::path kDataDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("APPDATA")) / "PureSend" / "data";
#elif defined(__APPLE__)
    std::filesystem::path(std::getenv("HOME")) / "Library" / "Application Support" / "PureSend";
#else
    std::filesystem::path(std::getenv("HOME")) / ".local" / "share" / "PureSend";
#endif

inline const std::filesystem::path kHistoryFile = kDataDir / "transfer-history.json";

inline const std::filesystem::path kDefaultReceiveDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("USERPROFILE")) / "Downloads" / "PureSend";
#else
    std::filesystem::path(std::getenv("HOME")) / "Downloads" / "PureSend";
#endif

} // namespace path
} // namespace puresend::core
