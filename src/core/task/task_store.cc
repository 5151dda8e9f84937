#include <algorithm>
#include <core/task/task_store.h>
#include <core/util/time.h>
#include <spdlog/spdlog.h>

namespace puresend::core {

namespace {

template<typename T>
std::vector<T> sortedBySequence(std::vector<T> values) {
    std::sort(values.begin(), values.end(), [](const T& a, const T& b) {
        return a.sequence < b.sequence;
    });
    return values;
}

} // namespace

void TaskStore::SetCompletedCallback(CompletedCallback callback) {
    completed_callback_ = std::move(callback);
}

std::string TaskStore::CreateTask(const TaskDescriptor& descriptor) {
    if (tasks_.contains(descriptor.id)) {
        spdlog::warn("TaskStore: task {} is already tracked", descriptor.id);
        return descriptor.id;
    }
    TransferTask task;
    task.id = descriptor.id;
    task.file = descriptor.file;
    task.direction = descriptor.direction;
    task.peer = descriptor.peer;
    task.created_at = NowMillis();
    task.sequence = next_sequence_++;
    tasks_.emplace(descriptor.id, std::move(task));
    spdlog::debug("TaskStore: created task {} ({}, {} bytes)",
                  descriptor.id,
                  descriptor.file.name,
                  descriptor.file.size);
    return descriptor.id;
}

bool TaskStore::ApplyProgress(const std::string& task_id,
                              std::uint64_t bytes_transferred,
                              std::uint64_t speed) {
    auto* task = find(task_id);
    if (!task) {
        spdlog::debug("TaskStore: progress for unknown task {} dropped", task_id);
        return false;
    }
    if (task->status != TaskStatus::kPending && task->status != TaskStatus::kTransferring) {
        spdlog::debug("TaskStore: progress for {} task {} dropped",
                      TaskStatusToString(task->status),
                      task_id);
        return false;
    }

    if (task->file.size > 0) {
        bytes_transferred = std::min(bytes_transferred, task->file.size);
    }
    // Progress only moves forward; an older report still refreshes the speed
    task->bytes_transferred = std::max(task->bytes_transferred, bytes_transferred);
    task->speed = speed;
    task->status = TaskStatus::kTransferring;
    task->progress = ProgressPercent(task->bytes_transferred, task->file.size);
    return true;
}

bool TaskStore::ApplyTerminal(const std::string& task_id,
                              TaskStatus status,
                              std::optional<std::string> error) {
    if (!IsTerminal(status)) {
        spdlog::error("TaskStore: {} is not a terminal status", TaskStatusToString(status));
        return false;
    }
    auto* task = find(task_id);
    if (!task) {
        spdlog::debug("TaskStore: {} for unknown task {} dropped",
                      TaskStatusToString(status),
                      task_id);
        return false;
    }
    if (IsTerminal(task->status)) {
        spdlog::debug("TaskStore: task {} is already {}, {} ignored",
                      task_id,
                      TaskStatusToString(task->status),
                      TaskStatusToString(status));
        return false;
    }

    task->status = status;
    task->speed = 0;
    task->resumable = false;
    task->resume_offset = 0;
    task->completed_at = NowMillis();
    if (status == TaskStatus::kCompleted) {
        task->bytes_transferred = task->file.size;
        task->progress = 100;
        task->error = std::nullopt;
    } else {
        task->error = std::move(error);
    }
    spdlog::info("Task {} ({}) {}", task_id, task->file.name, TaskStatusToString(status));

    if (status == TaskStatus::kCompleted && completed_callback_) {
        completed_callback_(*task);
    }
    return true;
}

bool TaskStore::ApplyInterrupted(const std::string& task_id,
                                 std::uint64_t bytes_transferred,
                                 std::string message) {
    auto* task = find(task_id);
    if (!task) {
        spdlog::debug("TaskStore: interruption of unknown task {} dropped", task_id);
        return false;
    }
    if (task->status != TaskStatus::kPending && task->status != TaskStatus::kTransferring) {
        spdlog::debug("TaskStore: interruption of {} task {} dropped",
                      TaskStatusToString(task->status),
                      task_id);
        return false;
    }
    if (task->file.size > 0) {
        bytes_transferred = std::min(bytes_transferred, task->file.size);
    }
    task->status = TaskStatus::kInterrupted;
    task->bytes_transferred = std::max(task->bytes_transferred, bytes_transferred);
    task->progress = ProgressPercent(task->bytes_transferred, task->file.size);
    task->speed = 0;
    task->resumable = true;
    task->resume_offset = bytes_transferred;
    task->error = std::move(message);
    spdlog::info("Task {} interrupted at {} bytes", task_id, bytes_transferred);
    return true;
}

bool TaskStore::MarkResuming(const std::string& task_id) {
    auto* task = find(task_id);
    if (!task || task->status != TaskStatus::kInterrupted) {
        return false;
    }
    task->status = TaskStatus::kTransferring;
    task->error = std::nullopt;
    task->resumable = false;
    task->resumed = true;
    return true;
}

std::optional<TransferTask> TaskStore::Get(const std::string& task_id) const {
    if (auto it = tasks_.find(task_id); it != tasks_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool TaskStore::Contains(const std::string& task_id) const {
    return tasks_.contains(task_id);
}

bool TaskStore::Remove(const std::string& task_id) {
    return tasks_.erase(task_id) > 0;
}

std::vector<std::string> TaskStore::RemoveFinished() {
    std::vector<std::string> removed;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second.status == TaskStatus::kCompleted
            || it->second.status == TaskStatus::kCancelled) {
            removed.push_back(it->first);
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<TransferTask> TaskStore::List() const {
    std::vector<TransferTask> result;
    result.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        result.push_back(task);
    }
    return sortedBySequence(std::move(result));
}

std::vector<TransferTask> TaskStore::List(TransferDirection direction) const {
    std::vector<TransferTask> result;
    for (const auto& [id, task] : tasks_) {
        if (task.direction == direction) {
            result.push_back(task);
        }
    }
    return sortedBySequence(std::move(result));
}

std::optional<AccessRequest> TaskStore::UpsertRequest(const AccessRequest& request) {
    auto it = requests_.find(request.id);
    if (it == requests_.end()) {
        AccessRequest stored = request;
        stored.sequence = next_sequence_++;
        if (stored.label.empty()) {
            stored.label = DeriveClientLabel(stored.client_id, stored.address);
        }
        spdlog::info("New {} request {} from {} ({})",
                     request.channel == RelayChannel::kUpload ? "upload" : "download",
                     request.id,
                     stored.label,
                     stored.address);
        return requests_.emplace(request.id, std::move(stored)).first->second;
    }

    auto& stored = it->second;
    if (!CanTransition(stored.status, request.status)) {
        spdlog::warn("Request {}: status change refused", request.id);
        return std::nullopt;
    }
    stored.status = request.status;
    if (!request.address.empty()) {
        stored.address = request.address;
    }
    if (!request.client_id.empty()) {
        stored.client_id = request.client_id;
    }
    if (!request.label.empty()) {
        stored.label = request.label;
    }
    if (!request.records.empty()) {
        stored.records = request.records;
    }
    if (request.expires_at) {
        stored.expires_at = request.expires_at;
    }
    return stored;
}

bool TaskStore::SetRequestStatus(const std::string& request_id, ApprovalStatus status) {
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        spdlog::debug("TaskStore: status change for unknown request {} dropped", request_id);
        return false;
    }
    if (!CanTransition(it->second.status, status)) {
        spdlog::warn("Request {}: status change refused", request_id);
        return false;
    }
    it->second.status = status;
    return true;
}

bool TaskStore::UpsertRequestRecord(const std::string& request_id, const TransferRecord& record) {
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return false;
    }
    auto& records = it->second.records;
    auto existing = std::find_if(records.begin(), records.end(), [&](const TransferRecord& r) {
        return r.id == record.id;
    });
    if (existing != records.end()) {
        *existing = record;
    } else {
        records.push_back(record);
    }
    return true;
}

std::optional<AccessRequest> TaskStore::GetRequest(const std::string& request_id) const {
    if (auto it = requests_.find(request_id); it != requests_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<AccessRequest> TaskStore::FindLatestRequest(RelayChannel channel,
                                                          const std::string& address) const {
    const AccessRequest* latest = nullptr;
    for (const auto& [id, request] : requests_) {
        if (request.channel != channel || request.address != address) {
            continue;
        }
        if (!latest || request.requested_at > latest->requested_at
            || (request.requested_at == latest->requested_at
                && request.sequence > latest->sequence)) {
            latest = &request;
        }
    }
    if (!latest) {
        return std::nullopt;
    }
    return *latest;
}

bool TaskStore::RemoveRequest(const std::string& request_id) {
    return requests_.erase(request_id) > 0;
}

std::vector<std::string> TaskStore::ClearRequests(RelayChannel channel) {
    std::vector<std::string> removed;
    for (auto it = requests_.begin(); it != requests_.end();) {
        if (it->second.channel == channel) {
            removed.push_back(it->first);
            it = requests_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<AccessRequest> TaskStore::ListRequests(RelayChannel channel) const {
    std::vector<AccessRequest> result;
    for (const auto& [id, request] : requests_) {
        if (request.channel == channel) {
            result.push_back(request);
        }
    }
    return sortedBySequence(std::move(result));
}

TransferTask* TaskStore::find(const std::string& task_id) {
    if (auto it = tasks_.find(task_id); it != tasks_.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace puresend::core
