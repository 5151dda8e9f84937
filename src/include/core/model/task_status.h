#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace puresend::core {

enum class TaskStatus {
    kPending,      // 已提交，尚未开始
    kTransferring, // 传输中
    kCompleted,    // 已完成
    kFailed,       // 失败，需重新创建任务
    kCancelled,    // 本地取消
    kInterrupted,  // 中断，可从断点恢复
};

NLOHMANN_JSON_SERIALIZE_ENUM(TaskStatus,
                             {
                                 {TaskStatus::kPending, "pending"},
                                 {TaskStatus::kTransferring, "transferring"},
                                 {TaskStatus::kCompleted, "completed"},
                                 {TaskStatus::kFailed, "failed"},
                                 {TaskStatus::kCancelled, "cancelled"},
                                 {TaskStatus::kInterrupted, "interrupted"},
                             })

enum class TransferDirection {
    kSend,
    kReceive,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferDirection,
                             {
                                 {TransferDirection::kSend, "send"},
                                 {TransferDirection::kReceive, "receive"},
                             })

enum class TransferMode {
    kDirect, // peer-to-peer channel
    kRelay,  // embedded HTTP relay server
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferMode,
                             {
                                 {TransferMode::kDirect, "direct"},
                                 {TransferMode::kRelay, "relay"},
                             })

// Statuses a task never leaves
inline bool IsTerminal(TaskStatus status) {
    return status == TaskStatus::kCompleted || status == TaskStatus::kFailed
           || status == TaskStatus::kCancelled;
}

inline std::string_view TaskStatusToString(TaskStatus status) {
    switch (status) {
    case TaskStatus::kPending:
        return "pending";
    case TaskStatus::kTransferring:
        return "transferring";
    case TaskStatus::kCompleted:
        return "completed";
    case TaskStatus::kFailed:
        return "failed";
    case TaskStatus::kCancelled:
        return "cancelled";
    case TaskStatus::kInterrupted:
        return "interrupted";
    }
    return "unknown";
}

inline std::optional<TaskStatus> TaskStatusFromString(std::string_view value) {
    for (auto status : {TaskStatus::kPending,
                        TaskStatus::kTransferring,
                        TaskStatus::kCompleted,
                        TaskStatus::kFailed,
                        TaskStatus::kCancelled,
                        TaskStatus::kInterrupted}) {
        if (TaskStatusToString(status) == value) {
            return status;
        }
    }
    return std::nullopt;
}

// floor(transferred / total * 100), 0 for an empty total
inline int ProgressPercent(std::uint64_t transferred, std::uint64_t total) {
    if (total == 0) {
        return 0;
    }
    if (transferred >= total) {
        return 100;
    }
    return static_cast<int>(transferred * 100 / total);
}

} // namespace puresend::core
