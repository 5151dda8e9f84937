#include <algorithm>
#include <core/task/view_projector.h>

namespace puresend::core {

namespace {

std::vector<UnifiedTaskItem> project(const TaskStore& store,
                                     const TaskItemBoard& board,
                                     TransferDirection direction,
                                     TaskOrigin relay_origin) {
    std::vector<UnifiedTaskItem> items;
    for (const auto& task : store.List(direction)) {
        items.push_back(ToTaskItem(task));
    }
    auto relay = board.List(relay_origin);
    items.insert(items.end(), relay.begin(), relay.end());

    std::stable_sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        bool a_direct = a.origin() == TaskOrigin::kDirect;
        bool b_direct = b.origin() == TaskOrigin::kDirect;
        if (a_direct != b_direct) {
            return a_direct;
        }
        return a.sequence < b.sequence;
    });
    return items;
}

} // namespace

ApprovalStatus DeriveApprovalStatus(TaskStatus status) {
    switch (status) {
    case TaskStatus::kTransferring:
    case TaskStatus::kCompleted:
        return ApprovalStatus::kAccepted;
    case TaskStatus::kFailed:
    case TaskStatus::kCancelled:
        return ApprovalStatus::kRejected;
    case TaskStatus::kPending:
    case TaskStatus::kInterrupted:
        return ApprovalStatus::kPending;
    }
    return ApprovalStatus::kPending;
}

UnifiedTaskItem ToTaskItem(const TransferTask& task) {
    UnifiedTaskItem item;
    item.id = TaskItemId{TaskOrigin::kDirect, task.id};
    item.counterpart_label = task.peer.name.empty() ? task.peer.address : task.peer.name;
    item.counterpart_address = task.peer.address;
    item.files.push_back(TaskFileEntry{
        .name = task.file.name,
        .size = task.file.size,
        .bytes_transferred = task.bytes_transferred,
        .progress = task.progress,
        .speed = task.speed,
        .status = task.status,
        .started_at = task.created_at,
    });
    item.approval_status = DeriveApprovalStatus(task.status);
    item.transfer_status = task.status;
    item.total_size = task.file.size;
    item.total_transferred = task.bytes_transferred;
    item.progress = task.progress;
    item.speed = task.status == TaskStatus::kTransferring ? task.speed : 0;
    item.created_at = task.created_at;
    item.completed_at = task.completed_at;
    item.error = task.error;
    item.sequence = task.sequence;
    return item;
}

std::vector<UnifiedTaskItem> ProjectSendTasks(const TaskStore& store, const TaskItemBoard& board) {
    return project(store, board, TransferDirection::kSend, TaskOrigin::kRelayDownload);
}

std::vector<UnifiedTaskItem> ProjectReceiveTasks(const TaskStore& store, const TaskItemBoard& board) {
    return project(store, board, TransferDirection::kReceive, TaskOrigin::kRelayUpload);
}

std::vector<UnifiedTaskItem> PendingOnly(std::vector<UnifiedTaskItem> items) {
    std::erase_if(items, [](const UnifiedTaskItem& item) {
        return item.approval_status != ApprovalStatus::kPending;
    });
    return items;
}

} // namespace puresend::core
