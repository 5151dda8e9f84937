#pragma once

#include <core/model/task_item.h>
#include <core/model/transfer_task.h>
#include <core/task/task_item_board.h>
#include <core/task/task_store.h>
#include <vector>

namespace puresend::core {

// Approval status shown for a direct task, which has no approval step of its own
ApprovalStatus DeriveApprovalStatus(TaskStatus status);

// Single-file item view of a direct task
UnifiedTaskItem ToTaskItem(const TransferTask& task);

// Direct send tasks and relay-download items, newest first
std::vector<UnifiedTaskItem> ProjectSendTasks(const TaskStore& store, const TaskItemBoard& board);

// Direct receive tasks and relay-upload items, newest first
std::vector<UnifiedTaskItem> ProjectReceiveTasks(const TaskStore& store, const TaskItemBoard& board);

std::vector<UnifiedTaskItem> PendingOnly(std::vector<UnifiedTaskItem> items);

} // namespace puresend::core
