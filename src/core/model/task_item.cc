#include <algorithm>
#include <core/model/task_item.h>
#include <fmt/format.h>

using json = nlohmann::json;

namespace puresend::core {

namespace {

constexpr std::string_view kDirectPrefix = "p2p-";
constexpr std::string_view kRelayPrefix = "web-";

} // namespace

std::string TaskItemId::ToString() const {
    return fmt::format("{}{}", origin == TaskOrigin::kDirect ? kDirectPrefix : kRelayPrefix, inner);
}

std::optional<TaskItemId> TaskItemId::Parse(std::string_view text, TransferDirection side) {
    if (text.starts_with(kDirectPrefix) && text.size() > kDirectPrefix.size()) {
        return TaskItemId{TaskOrigin::kDirect, std::string(text.substr(kDirectPrefix.size()))};
    }
    if (text.starts_with(kRelayPrefix) && text.size() > kRelayPrefix.size()) {
        // Relay uploads land on the receive side, relay downloads on the send side
        auto origin = side == TransferDirection::kReceive ? TaskOrigin::kRelayUpload
                                                          : TaskOrigin::kRelayDownload;
        return TaskItemId{origin, std::string(text.substr(kRelayPrefix.size()))};
    }
    return std::nullopt;
}

void UnifiedTaskItem::RecomputeAggregate(Millis now) {
    total_size = 0;
    total_transferred = 0;
    speed = 0;
    bool all_finished = !files.empty();
    bool any_failed = false;
    bool any_transferring = false;
    for (const auto& file : files) {
        total_size += file.size;
        total_transferred += file.bytes_transferred;
        switch (file.status) {
        case TaskStatus::kTransferring:
            speed += file.speed;
            any_transferring = true;
            all_finished = false;
            break;
        case TaskStatus::kCompleted:
            break;
        case TaskStatus::kFailed:
            any_failed = true;
            break;
        default:
            all_finished = false;
            break;
        }
    }
    progress = ProgressPercent(total_transferred, total_size);

    if (all_finished) {
        transfer_status = any_failed ? TaskStatus::kFailed : TaskStatus::kCompleted;
        if (!completed_at) {
            completed_at = now;
        }
        return;
    }

    // A new file reopened a finished item
    if (transfer_status == TaskStatus::kCompleted || transfer_status == TaskStatus::kFailed) {
        transfer_status = TaskStatus::kTransferring;
        completed_at = std::nullopt;
    } else if (any_transferring && transfer_status != TaskStatus::kCancelled) {
        transfer_status = TaskStatus::kTransferring;
    }
}

void to_json(json& j, const TaskFileEntry& entry) {
    j = json{
        {"name", entry.name},
        {"size", entry.size},
        {"transferredBytes", entry.bytes_transferred},
        {"progress", entry.progress},
        {"speed", entry.speed},
        {"status", entry.status},
    };
    if (entry.started_at) {
        j["startedAt"] = *entry.started_at;
    }
    if (entry.record_id) {
        j["recordId"] = *entry.record_id;
    }
}

void to_json(json& j, const UnifiedTaskItem& item) {
    j = json{
        {"id", item.id.ToString()},
        {"origin", item.id.origin},
        {"counterpartLabel", item.counterpart_label},
        {"counterpartAddress", item.counterpart_address},
        {"files", item.files},
        {"fileCount", item.files.size()},
        {"approvalStatus", item.approval_status},
        {"totalSize", item.total_size},
        {"totalTransferredBytes", item.total_transferred},
        {"progress", item.progress},
        {"speed", item.speed},
        {"createdAt", item.created_at},
        {"sourceId", item.source_id()},
    };
    if (item.transfer_status) {
        j["transferStatus"] = *item.transfer_status;
    } else {
        j["transferStatus"] = "none";
    }
    if (item.completed_at) {
        j["completedAt"] = *item.completed_at;
    }
    if (item.error) {
        j["error"] = *item.error;
    }
}

} // namespace puresend::core
