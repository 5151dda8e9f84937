#pragma once

#include <core/model/access_request.h>
#include <core/task/task_item_board.h>
#include <core/task/task_store.h>
#include <core/transport/transport.h>
#include <string>

namespace puresend::core {

/**
 * @brief Approval state of relay requests, mirrored onto their UnifiedTaskItems
 *
 * @details Uploads pushed by a browser and downloads fetched by a browser go through the
 * same flow. Local decisions are forwarded to the transport before anything changes
 * here, so a TransportError leaves the request untouched. Status reports coming from the
 * transport are folded in by the On* handlers.
 */
class ApprovalWorkflow {
public:
    ApprovalWorkflow(TaskStore& store, TaskItemBoard& board, Transport& transport);
    ApprovalWorkflow(const ApprovalWorkflow&) = delete;
    ApprovalWorkflow& operator=(const ApprovalWorkflow&) = delete;

    // Return false when the request is unknown or no longer pending. Throw TransportError.
    bool Accept(RelayChannel channel, const std::string& request_id);
    bool Reject(RelayChannel channel, const std::string& request_id);

    // Drops the request on both sides. The task item stays on the board.
    void Remove(RelayChannel channel, const std::string& request_id);
    void Clear(RelayChannel channel);

    void OnRequestCreated(const AccessRequest& request);
    void OnRequestStatusChanged(const AccessRequest& request);
    void OnRequestRemoved(RelayChannel channel, const std::string& request_id);

    // Creates the item on first sight and copies the approval status onto it
    UnifiedTaskItem& SyncItem(const AccessRequest& request);

private:
    bool decide(RelayChannel channel, const std::string& request_id, ApprovalStatus decision);

    TaskStore& store_;
    TaskItemBoard& board_;
    Transport& transport_;
};

} // namespace puresend::core
