#pragma once

#include <core/model/access_request.h>
#include <core/model/transfer_task.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace puresend::core {

/**
 * @brief Owner of every TransferTask and AccessRequest
 *
 * @details Mutations on unknown ids, and on tasks that already reached a terminal
 * status, are logged and ignored, so late or duplicated transport events cannot move a
 * task backwards. Readers get copies.
 */
class TaskStore {
public:
    using CompletedCallback = std::function<void(const TransferTask&)>;

    TaskStore() = default;
    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    // Called once per task when it becomes completed
    void SetCompletedCallback(CompletedCallback callback);

    // Starts tracking a task in `pending`. An id that is already tracked keeps its record.
    std::string CreateTask(const TaskDescriptor& descriptor);

    bool ApplyProgress(const std::string& task_id, std::uint64_t bytes_transferred, std::uint64_t speed);

    // status must be completed, failed or cancelled
    bool ApplyTerminal(const std::string& task_id,
                       TaskStatus status,
                       std::optional<std::string> error = std::nullopt);

    bool ApplyInterrupted(const std::string& task_id,
                          std::uint64_t bytes_transferred,
                          std::string message);

    // interrupted -> transferring, clearing error and checkpoint flags
    bool MarkResuming(const std::string& task_id);

    std::optional<TransferTask> Get(const std::string& task_id) const;
    bool Contains(const std::string& task_id) const;
    bool Remove(const std::string& task_id);

    // Removes completed and cancelled tasks, returns their ids
    std::vector<std::string> RemoveFinished();

    // Ordered by insertion
    std::vector<TransferTask> List() const;
    std::vector<TransferTask> List(TransferDirection direction) const;

    // Access requests

    // Inserts or refreshes a request. The status moves only along CanTransition; the
    // stored records are kept when the incoming request carries none.
    // Returns the stored request, nullopt if the status change was refused.
    std::optional<AccessRequest> UpsertRequest(const AccessRequest& request);

    bool SetRequestStatus(const std::string& request_id, ApprovalStatus status);

    // Inserts or replaces the record with the same id
    bool UpsertRequestRecord(const std::string& request_id, const TransferRecord& record);

    std::optional<AccessRequest> GetRequest(const std::string& request_id) const;

    // Newest request (by request time, then insertion) on `channel` from `address`
    std::optional<AccessRequest> FindLatestRequest(RelayChannel channel,
                                                   const std::string& address) const;

    bool RemoveRequest(const std::string& request_id);
    std::vector<std::string> ClearRequests(RelayChannel channel);

    std::vector<AccessRequest> ListRequests(RelayChannel channel) const;

private:
    TransferTask* find(const std::string& task_id);

    std::unordered_map<std::string, TransferTask> tasks_;
    std::unordered_map<std::string, AccessRequest> requests_;
    std::uint64_t next_sequence_{1};
    CompletedCallback completed_callback_;
};

} // namespace puresend::core
