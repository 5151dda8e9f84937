#include <algorithm>
#include <array>
#include <core/model/history_item.h>
#include <string_view>

using json = nlohmann::json;

namespace puresend::core {

namespace {

std::optional<std::string> optionalString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<TransferMode> parseMode(const json& j) {
    auto mode = optionalString(j, "mode");
    if (!mode) {
        return std::nullopt;
    }
    if (*mode == "direct" || *mode == "local") {
        return TransferMode::kDirect;
    }
    if (*mode == "relay") {
        return TransferMode::kRelay;
    }
    return std::nullopt;
}

constexpr std::array<std::string_view, 11> kKnownKeys = {
    "id",
    "fileName",
    "fileSize",
    "peerName",
    "peerAddress",
    "peerIp",
    "status",
    "direction",
    "completedAt",
    "mode",
    "error",
};

bool isKnownKey(std::string_view key) {
    return std::find(kKnownKeys.begin(), kKnownKeys.end(), key) != kKnownKeys.end();
}

// Key absent, or present with a string value accepted by `accept`
template<typename Accept>
bool stringKeyValid(const json& j, const char* key, Accept accept) {
    if (!j.contains(key)) {
        return true;
    }
    return j[key].is_string() && accept(j[key].get<std::string>());
}

} // namespace

void to_json(json& j, const HistoryItem& item) {
    j = json{
        {"id", item.id},
        {"fileName", item.file_name},
        {"fileSize", item.file_size},
        {"peerName", item.peer_name},
        {"status", item.status},
        {"direction", item.direction},
        {"completedAt", item.completed_at},
    };
    if (item.peer_address) {
        j["peerAddress"] = *item.peer_address;
    }
    if (item.mode) {
        j["mode"] = *item.mode;
    }
    if (item.error) {
        j["error"] = *item.error;
    }
    if (item.extra.is_object()) {
        for (const auto& [key, value] : item.extra.items()) {
            if (!j.contains(key)) {
                j[key] = value;
            }
        }
    }
}

void from_json(const json& j, HistoryItem& item) {
    j.at("id").get_to(item.id);
    item.file_name = j.value("fileName", std::string{});
    item.file_size = j.value("fileSize", std::uint64_t{0});
    item.peer_name = j.value("peerName", std::string{});
    item.peer_address = optionalString(j, "peerAddress");
    if (!item.peer_address) {
        item.peer_address = optionalString(j, "peerIp");
    }
    auto status = TaskStatusFromString(j.value("status", std::string{"completed"}));
    item.status = status.value_or(TaskStatus::kCompleted);
    item.direction = j.value("direction", std::string{"send"}) == "receive"
                         ? TransferDirection::kReceive
                         : TransferDirection::kSend;
    item.completed_at = j.value("completedAt", Millis{0});
    item.mode = parseMode(j);
    item.error = optionalString(j, "error");

    item.extra = json();
    for (const auto& [key, value] : j.items()) {
        if (!isKnownKey(key)) {
            item.extra[key] = value;
        }
    }
    // peerIp only stands in for a missing peerAddress
    if (j.contains("peerAddress") && j.contains("peerIp")) {
        item.extra["peerIp"] = j["peerIp"];
    }
}

std::optional<HistoryItem> ReadHistoryItem(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        return std::nullopt;
    }
    auto valid = stringKeyValid(j, "status", [](const std::string& v) {
                     return TaskStatusFromString(v).has_value();
                 })
                 && stringKeyValid(j, "direction", [](const std::string& v) {
                        return v == "send" || v == "receive";
                    })
                 && stringKeyValid(j, "mode", [](const std::string& v) {
                        return v == "direct" || v == "local" || v == "relay";
                    });
    for (const char* key : {"fileName", "peerName", "peerAddress", "peerIp", "error"}) {
        valid = valid && stringKeyValid(j, key, [](const std::string&) { return true; });
    }
    valid = valid && (!j.contains("fileSize") || j["fileSize"].is_number_unsigned());
    valid = valid && (!j.contains("completedAt") || j["completedAt"].is_number_integer());
    if (!valid) {
        return std::nullopt;
    }
    try {
        return j.get<HistoryItem>();
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace puresend::core
