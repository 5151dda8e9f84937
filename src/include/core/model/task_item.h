#pragma once

#include "task_status.h"
#include <compare>
#include <core/util/time.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace puresend::core {

enum class TaskOrigin {
    kDirect,        // 点对点直连任务
    kRelayUpload,   // 浏览器通过中继服务器向本机上传
    kRelayDownload, // 浏览器通过中继服务器从本机下载
};

NLOHMANN_JSON_SERIALIZE_ENUM(TaskOrigin,
                             {
                                 {TaskOrigin::kDirect, "direct"},
                                 {TaskOrigin::kRelayUpload, "relayUpload"},
                                 {TaskOrigin::kRelayDownload, "relayDownload"},
                             })

// Origin-tagged identifier of a UnifiedTaskItem. Two items can only collide when both
// the origin and the inner id match.
struct TaskItemId {
    TaskOrigin origin{TaskOrigin::kDirect};
    std::string inner; // TransferTask id or relay request id

    auto operator<=>(const TaskItemId&) const = default;

    // "p2p-<id>" for direct tasks, "web-<id>" for relay requests
    std::string ToString() const;
    static std::optional<TaskItemId> Parse(std::string_view text, TransferDirection side);
};

enum class ApprovalStatus {
    kPending,
    kAccepted,
    kRejected,
    kExpired,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ApprovalStatus,
                             {
                                 {ApprovalStatus::kPending, "pending"},
                                 {ApprovalStatus::kAccepted, "accepted"},
                                 {ApprovalStatus::kRejected, "rejected"},
                                 {ApprovalStatus::kExpired, "expired"},
                             })

struct TaskFileEntry {
    std::string name;
    std::uint64_t size{0};
    std::uint64_t bytes_transferred{0};
    int progress{0};
    std::uint64_t speed{0};
    TaskStatus status{TaskStatus::kTransferring};
    std::optional<Millis> started_at;
    std::optional<std::string> record_id; // relay sub-transfer record
};

struct UnifiedTaskItem {
    TaskItemId id;
    std::string counterpart_label;
    std::string counterpart_address;
    std::vector<TaskFileEntry> files;

    ApprovalStatus approval_status{ApprovalStatus::kPending};
    std::optional<TaskStatus> transfer_status; // nullopt: not started yet
    std::uint64_t total_size{0};
    std::uint64_t total_transferred{0};
    int progress{0};
    std::uint64_t speed{0};

    Millis created_at{0};
    std::optional<Millis> completed_at;
    std::optional<std::string> error;

    std::uint64_t sequence{0};

    TaskOrigin origin() const { return id.origin; }

    // TransferTask id for direct items, request id for relay items
    const std::string& source_id() const { return id.inner; }

    // Recomputes totals, progress, speed and the completion status from the file list
    void RecomputeAggregate(Millis now);
};

void to_json(nlohmann::json& j, const TaskFileEntry& entry);
void to_json(nlohmann::json& j, const UnifiedTaskItem& item);

} // namespace puresend::core
