#include <core/task/resume_manager.h>
#include <spdlog/spdlog.h>

namespace puresend::core {

ResumeManager::ResumeManager(TaskStore& store, Transport& transport)
    : store_(store)
    , transport_(transport) {}

std::vector<ResumableTransfer> ResumeManager::ListResumable() {
    try {
        return transport_.ListResumableDirectTransfers();
    } catch (const TransportError& e) {
        spdlog::error("Failed to list resumable transfers: {}", e.what());
        return {};
    }
}

bool ResumeManager::Resume(const std::string& task_id) {
    auto task = store_.Get(task_id);
    if (!task) {
        spdlog::warn("Cannot resume task {}: unknown task", task_id);
        return false;
    }
    if (task->status != TaskStatus::kInterrupted) {
        spdlog::warn("Cannot resume task {}: task is {}", task_id, TaskStatusToString(task->status));
        return false;
    }

    store_.MarkResuming(task_id);
    try {
        transport_.ResumeDirectTransfer(task_id);
    } catch (const TransportError& e) {
        spdlog::error("Failed to resume task {}: {}", task_id, e.what());
        store_.ApplyTerminal(task_id, TaskStatus::kFailed, e.what());
        return false;
    }
    spdlog::info("Task {} resumed from {} bytes", task_id, task->resume_offset);
    return true;
}

std::size_t ResumeManager::Cleanup(const std::optional<std::string>& task_id) {
    if (task_id) {
        try {
            transport_.CleanupResumeState(task_id);
        } catch (const TransportError& e) {
            spdlog::error("Failed to clean checkpoint of task {}: {}", *task_id, e.what());
            return 0;
        }
        return 1;
    }

    std::size_t cleaned = 0;
    for (const auto& transfer : ListResumable()) {
        if (store_.Contains(transfer.task_id)) {
            continue;
        }
        try {
            transport_.CleanupResumeState(transfer.task_id);
            ++cleaned;
        } catch (const TransportError& e) {
            spdlog::error("Failed to clean checkpoint of task {}: {}", transfer.task_id, e.what());
        }
    }
    spdlog::info("Discarded {} orphaned checkpoint(s)", cleaned);
    return cleaned;
}

} // namespace puresend::core
