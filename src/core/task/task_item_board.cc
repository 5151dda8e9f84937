#include <algorithm>
#include <core/task/task_item_board.h>
#include <spdlog/spdlog.h>

namespace puresend::core {

UnifiedTaskItem& TaskItemBoard::Ensure(const TaskItemId& id,
                                       const std::string& label,
                                       const std::string& address,
                                       Millis now) {
    if (auto it = items_.find(id); it != items_.end()) {
        return it->second;
    }
    UnifiedTaskItem item;
    item.id = id;
    item.counterpart_label = label.empty() ? address : label;
    item.counterpart_address = address;
    item.created_at = now;
    item.sequence = next_sequence_++;
    spdlog::debug("TaskItemBoard: new item {} for {}", id.ToString(), item.counterpart_label);
    return items_.emplace(id, std::move(item)).first->second;
}

UnifiedTaskItem* TaskItemBoard::Find(const TaskItemId& id) {
    if (auto it = items_.find(id); it != items_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::optional<UnifiedTaskItem> TaskItemBoard::Get(const TaskItemId& id) const {
    if (auto it = items_.find(id); it != items_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool TaskItemBoard::Contains(const TaskItemId& id) const {
    return items_.contains(id);
}

UnifiedTaskItem* TaskItemBoard::FindLatestByAddress(TaskOrigin origin, const std::string& address) {
    UnifiedTaskItem* latest = nullptr;
    for (auto& [id, item] : items_) {
        if (id.origin != origin || item.counterpart_address != address) {
            continue;
        }
        if (!latest || item.sequence > latest->sequence) {
            latest = &item;
        }
    }
    return latest;
}

bool TaskItemBoard::Remove(const TaskItemId& id) {
    return items_.erase(id) > 0;
}

std::vector<TaskItemId> TaskItemBoard::RemoveFinished(TaskOrigin origin) {
    std::vector<TaskItemId> removed;
    for (auto it = items_.begin(); it != items_.end();) {
        const auto& status = it->second.transfer_status;
        if (it->first.origin == origin
            && (status == TaskStatus::kCompleted || status == TaskStatus::kCancelled)) {
            removed.push_back(it->first);
            it = items_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<UnifiedTaskItem> TaskItemBoard::List(TaskOrigin origin) const {
    std::vector<UnifiedTaskItem> result;
    for (const auto& [id, item] : items_) {
        if (id.origin == origin) {
            result.push_back(item);
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.sequence < b.sequence;
    });
    return result;
}

} // namespace puresend::core
