#pragma once

#include "task_status.h"
#include <core/util/time.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace puresend::core {

struct HistoryItem {
    std::string id;
    std::string file_name;
    std::uint64_t file_size{0};
    std::string peer_name;
    std::optional<std::string> peer_address; // omitted in privacy mode
    TaskStatus status{TaskStatus::kCompleted};
    TransferDirection direction{TransferDirection::kSend};
    Millis completed_at{0};
    std::optional<TransferMode> mode;
    std::optional<std::string> error;
    nlohmann::json extra; // keys written by other versions, kept as they are

    bool operator==(const HistoryItem&) const = default;
};

// Persisted form: {"version": N, "items": [...]}
struct HistoryDocument {
    int version{0};
    std::vector<HistoryItem> items;
    // Entries that could not be read, written back unchanged
    std::vector<nlohmann::json> unreadable;
};

void to_json(nlohmann::json& j, const HistoryItem& item);
// Tolerates legacy items: missing optional keys, older key names and unknown modes
void from_json(const nlohmann::json& j, HistoryItem& item);

// Strict variant used on load: nullopt when the entry has no string id, a value of the
// wrong type, or a status/direction/mode this version does not know, i.e. whenever
// rewriting it through HistoryItem would lose information.
std::optional<HistoryItem> ReadHistoryItem(const nlohmann::json& j);

} // namespace puresend::core
