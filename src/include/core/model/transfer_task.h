#pragma once

#include "task_status.h"
#include <core/util/time.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace puresend::core {

struct FileDescriptor {
    std::string name;
    std::uint64_t size{0};
    std::optional<std::string> hash; // 文件内容哈希，可选
};

struct PeerDescriptor {
    std::string id;
    std::string address; // IP 地址
    std::uint16_t port{0};
    std::string name;     // 展示名称
};

// What the transport hands back when a direct transfer is submitted or announced
struct TaskDescriptor {
    std::string id;
    FileDescriptor file;
    TransferDirection direction{TransferDirection::kSend};
    PeerDescriptor peer;
};

struct TransferTask {
    std::string id;
    FileDescriptor file;
    TransferDirection direction{TransferDirection::kSend};
    TransferMode mode{TransferMode::kDirect};
    PeerDescriptor peer;

    TaskStatus status{TaskStatus::kPending};
    int progress{0};
    std::uint64_t bytes_transferred{0};
    std::uint64_t speed{0}; // bytes per second

    bool resumable{false};
    std::uint64_t resume_offset{0};
    bool resumed{false};

    Millis created_at{0};
    std::optional<Millis> completed_at;
    std::optional<std::string> error;

    std::uint64_t sequence{0}; // insertion order inside the store
};

void to_json(nlohmann::json& j, const FileDescriptor& file);
void from_json(const nlohmann::json& j, FileDescriptor& file);

void to_json(nlohmann::json& j, const PeerDescriptor& peer);
void from_json(const nlohmann::json& j, PeerDescriptor& peer);

void to_json(nlohmann::json& j, const TransferTask& task);

} // namespace puresend::core
