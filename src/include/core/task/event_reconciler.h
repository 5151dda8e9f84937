#pragma once

#include <core/model/transport_event.h>
#include <core/task/approval_workflow.h>
#include <core/task/record_index_cache.h>
#include <core/task/task_item_board.h>
#include <core/task/task_store.h>
#include <cstddef>
#include <functional>

namespace puresend::core {

/**
 * @brief Folds transport events into the TaskStore and the TaskItemBoard
 *
 * @details Direct events are keyed by task id. Relay upload events carry the request id,
 * relay download events only the requester address, which is resolved to the newest
 * request from that address. Inside an item a file is found by record id through the
 * RecordIndexCache, then by the last entry with the same name that is still
 * transferring, then by the last entry with the same name.
 *
 * Two files with the same name in one request can be confused once their record ids
 * have been evicted from the cache.
 */
class EventReconciler {
public:
    // A relay file reached completed or failed
    using FileFinishedCallback = std::function<void(const UnifiedTaskItem& item,
                                                    std::size_t file_index)>;

    EventReconciler(TaskStore& store,
                    TaskItemBoard& board,
                    ApprovalWorkflow& approval,
                    std::size_t cache_capacity);
    EventReconciler(const EventReconciler&) = delete;
    EventReconciler& operator=(const EventReconciler&) = delete;

    void SetFileFinishedCallback(FileFinishedCallback callback);

    void Handle(const TransportEvent& event);

    // Evicts cached record locations of an item that left the board
    void ForgetItem(const TaskItemId& id);

    const RecordIndexCache& record_cache() const { return record_cache_; }

private:
    void handleDirect(const DirectEvent& event);
    void handleRequest(const RelayRequestEvent& event);
    void handleFile(const RelayFileEvent& event);

    void fileStarted(const RelayFileEvent& event);
    void fileUpdated(const RelayFileEvent& event);

    // Item the event belongs to, created for upload starts when create is true
    UnifiedTaskItem* resolveItem(const RelayFileEvent& event, bool create);
    std::optional<std::size_t> locateFile(UnifiedTaskItem& item, const RelayFileEvent& event);
    void recordOnRequest(const UnifiedTaskItem& item, const TaskFileEntry& file);

    TaskStore& store_;
    TaskItemBoard& board_;
    ApprovalWorkflow& approval_;
    RecordIndexCache record_cache_;
    FileFinishedCallback file_finished_callback_;
};

} // namespace puresend::core
