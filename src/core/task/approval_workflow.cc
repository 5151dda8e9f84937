#include <core/task/approval_workflow.h>
#include <core/util/time.h>
#include <spdlog/spdlog.h>

namespace puresend::core {

namespace {

std::string_view channelName(RelayChannel channel) {
    return channel == RelayChannel::kUpload ? "upload" : "download";
}

std::string_view approvalName(ApprovalStatus status) {
    switch (status) {
    case ApprovalStatus::kPending:
        return "pending";
    case ApprovalStatus::kAccepted:
        return "accepted";
    case ApprovalStatus::kRejected:
        return "rejected";
    case ApprovalStatus::kExpired:
        return "expired";
    }
    return "unknown";
}

// 拒绝或过期后，未完成的传输一律视为取消
void cancelUnfinished(UnifiedTaskItem& item, Millis now) {
    if (item.transfer_status == TaskStatus::kCompleted
        || item.transfer_status == TaskStatus::kFailed) {
        return;
    }
    item.transfer_status = TaskStatus::kCancelled;
    item.speed = 0;
    for (auto& file : item.files) {
        if (file.status == TaskStatus::kTransferring || file.status == TaskStatus::kPending) {
            file.status = TaskStatus::kCancelled;
            file.speed = 0;
        }
    }
    if (!item.completed_at) {
        item.completed_at = now;
    }
}

} // namespace

ApprovalWorkflow::ApprovalWorkflow(TaskStore& store, TaskItemBoard& board, Transport& transport)
    : store_(store)
    , board_(board)
    , transport_(transport) {}

bool ApprovalWorkflow::Accept(RelayChannel channel, const std::string& request_id) {
    return decide(channel, request_id, ApprovalStatus::kAccepted);
}

bool ApprovalWorkflow::Reject(RelayChannel channel, const std::string& request_id) {
    return decide(channel, request_id, ApprovalStatus::kRejected);
}

bool ApprovalWorkflow::decide(RelayChannel channel,
                              const std::string& request_id,
                              ApprovalStatus decision) {
    auto request = store_.GetRequest(request_id);
    if (!request || request->channel != channel) {
        spdlog::warn("Cannot {} {} request {}: unknown request",
                     decision == ApprovalStatus::kAccepted ? "accept" : "reject",
                     channelName(channel),
                     request_id);
        return false;
    }
    if (request->status != ApprovalStatus::kPending) {
        spdlog::warn("Cannot {} {} request {}: already {}",
                     decision == ApprovalStatus::kAccepted ? "accept" : "reject",
                     channelName(channel),
                     request_id,
                     approvalName(request->status));
        return false;
    }

    try {
        if (decision == ApprovalStatus::kAccepted) {
            transport_.AcceptRequest(channel, request_id);
        } else {
            transport_.RejectRequest(channel, request_id);
        }
    } catch (const TransportError& e) {
        spdlog::error("Transport refused to {} request {}: {}",
                      decision == ApprovalStatus::kAccepted ? "accept" : "reject",
                      request_id,
                      e.what());
        throw;
    }

    store_.SetRequestStatus(request_id, decision);
    request->status = decision;
    SyncItem(*request);
    spdlog::info("{} request {} {}", channelName(channel), request_id, approvalName(decision));
    return true;
}

void ApprovalWorkflow::Remove(RelayChannel channel, const std::string& request_id) {
    try {
        transport_.RemoveRequest(channel, request_id);
    } catch (const TransportError& e) {
        spdlog::error("Transport failed to remove request {}: {}", request_id, e.what());
        throw;
    }
    store_.RemoveRequest(request_id);
}

void ApprovalWorkflow::Clear(RelayChannel channel) {
    try {
        transport_.ClearRequests(channel);
    } catch (const TransportError& e) {
        spdlog::error("Transport failed to clear {} requests: {}", channelName(channel), e.what());
        throw;
    }
    auto removed = store_.ClearRequests(channel);
    spdlog::info("Cleared {} {} requests", removed.size(), channelName(channel));
}

void ApprovalWorkflow::OnRequestCreated(const AccessRequest& request) {
    auto stored = store_.UpsertRequest(request);
    if (!stored) {
        return;
    }
    SyncItem(*stored);
}

void ApprovalWorkflow::OnRequestStatusChanged(const AccessRequest& request) {
    if (!store_.GetRequest(request.id)) {
        spdlog::debug("Status change for unseen request {}, tracking it now", request.id);
    }
    auto stored = store_.UpsertRequest(request);
    if (!stored) {
        return;
    }
    SyncItem(*stored);
}

void ApprovalWorkflow::OnRequestRemoved(RelayChannel channel, const std::string& request_id) {
    if (!store_.RemoveRequest(request_id)) {
        spdlog::debug("Removal of unknown {} request {} ignored", channelName(channel), request_id);
    }
}

UnifiedTaskItem& ApprovalWorkflow::SyncItem(const AccessRequest& request) {
    auto now = NowMillis();
    auto& item = board_.Ensure(TaskItemId{OriginOf(request.channel), request.id},
                               request.label,
                               request.address,
                               request.requested_at > 0 ? request.requested_at : now);
    if (!request.label.empty()
        && (item.counterpart_label.empty() || item.counterpart_label == item.counterpart_address)) {
        item.counterpart_label = request.label;
    }
    item.approval_status = request.status;
    if (request.status == ApprovalStatus::kExpired || request.status == ApprovalStatus::kRejected) {
        cancelUnfinished(item, now);
    }
    return item;
}

} // namespace puresend::core
