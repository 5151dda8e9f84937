#include <core/task/approval_workflow.h>
#include <core/task/event_reconciler.h>
#include <gtest/gtest.h>
#include <utils/fake_transport.h>

using namespace puresend::core;

class ApprovalWorkflowTest : public ::testing::Test {
protected:
    ApprovalWorkflowTest()
        : approval(store, board, transport)
        , reconciler(store, board, approval, 16) {}

    void requestUpload(const std::string& id, ApprovalStatus status = ApprovalStatus::kPending) {
        reconciler.Handle(RelayRequestEvent{
            .kind = RelayRequestEvent::Kind::kCreated,
            .channel = RelayChannel::kUpload,
            .request = {.id = id, .address = "192.168.1.30", .status = status, .requested_at = 1000},
        });
    }

    void changeStatus(const std::string& id, ApprovalStatus status) {
        reconciler.Handle(RelayRequestEvent{
            .kind = RelayRequestEvent::Kind::kStatusChanged,
            .channel = RelayChannel::kUpload,
            .request = {.id = id, .address = "192.168.1.30", .status = status},
        });
    }

    void startFile(const std::string& request_id, const std::string& record_id) {
        reconciler.Handle(RelayFileEvent{
            .kind = RelayFileEvent::Kind::kStarted,
            .channel = RelayChannel::kUpload,
            .request_id = request_id,
            .client_address = "192.168.1.30",
            .record_id = record_id,
            .file_name = record_id + ".bin",
            .bytes_transferred = 10,
            .total_bytes = 100,
        });
    }

    UnifiedTaskItem item(const std::string& id) {
        return *board.Get(TaskItemId{TaskOrigin::kRelayUpload, id});
    }

    puresend::test::FakeTransport transport;
    TaskStore store;
    TaskItemBoard board;
    ApprovalWorkflow approval;
    EventReconciler reconciler;
};

TEST_F(ApprovalWorkflowTest, ExpiryCancelsTransferringItem) {
    requestUpload("req1", ApprovalStatus::kAccepted);
    startFile("req1", "rec1");
    ASSERT_EQ(item("req1").transfer_status, TaskStatus::kTransferring);

    changeStatus("req1", ApprovalStatus::kExpired);

    auto expired = item("req1");
    EXPECT_EQ(expired.approval_status, ApprovalStatus::kExpired);
    EXPECT_EQ(expired.transfer_status, TaskStatus::kCancelled);
    EXPECT_EQ(expired.speed, 0u);
    EXPECT_EQ(store.GetRequest("req1")->status, ApprovalStatus::kExpired);
}

TEST_F(ApprovalWorkflowTest, ExpiryKeepsCompletedItem) {
    requestUpload("req1", ApprovalStatus::kAccepted);
    startFile("req1", "rec1");
    reconciler.Handle(RelayFileEvent{
        .kind = RelayFileEvent::Kind::kCompleted,
        .channel = RelayChannel::kUpload,
        .request_id = "req1",
        .record_id = "rec1",
        .file_name = "rec1.bin",
    });
    ASSERT_EQ(item("req1").transfer_status, TaskStatus::kCompleted);

    changeStatus("req1", ApprovalStatus::kExpired);
    EXPECT_EQ(item("req1").approval_status, ApprovalStatus::kExpired);
    EXPECT_EQ(item("req1").transfer_status, TaskStatus::kCompleted);
}

TEST_F(ApprovalWorkflowTest, AcceptForwardsToTransport) {
    requestUpload("req1");
    ASSERT_EQ(item("req1").approval_status, ApprovalStatus::kPending);

    EXPECT_TRUE(approval.Accept(RelayChannel::kUpload, "req1"));
    EXPECT_EQ(transport.accepted, std::vector<std::string>{"req1"});
    EXPECT_EQ(store.GetRequest("req1")->status, ApprovalStatus::kAccepted);
    EXPECT_EQ(item("req1").approval_status, ApprovalStatus::kAccepted);
    EXPECT_FALSE(item("req1").transfer_status.has_value());

    // no longer pending
    EXPECT_FALSE(approval.Reject(RelayChannel::kUpload, "req1"));
    EXPECT_TRUE(transport.rejected.empty());
}

TEST_F(ApprovalWorkflowTest, TransportFailureLeavesRequestPending) {
    requestUpload("req1");
    transport.fail_requests = true;

    EXPECT_THROW(approval.Accept(RelayChannel::kUpload, "req1"), TransportError);
    EXPECT_EQ(store.GetRequest("req1")->status, ApprovalStatus::kPending);
    EXPECT_EQ(item("req1").approval_status, ApprovalStatus::kPending);
}

TEST_F(ApprovalWorkflowTest, RejectCancelsItem) {
    requestUpload("req1");
    EXPECT_TRUE(approval.Reject(RelayChannel::kUpload, "req1"));

    EXPECT_EQ(transport.rejected, std::vector<std::string>{"req1"});
    EXPECT_EQ(item("req1").approval_status, ApprovalStatus::kRejected);
    EXPECT_EQ(item("req1").transfer_status, TaskStatus::kCancelled);

    // files arriving afterwards are not attached
    startFile("req1", "rec1");
    EXPECT_TRUE(item("req1").files.empty());
}

TEST_F(ApprovalWorkflowTest, UnknownRequestIsRefused) {
    EXPECT_FALSE(approval.Accept(RelayChannel::kUpload, "nope"));
    EXPECT_FALSE(approval.Accept(RelayChannel::kDownload, "nope"));
    EXPECT_TRUE(transport.accepted.empty());
}

TEST_F(ApprovalWorkflowTest, WrongChannelIsRefused) {
    requestUpload("req1");
    EXPECT_FALSE(approval.Accept(RelayChannel::kDownload, "req1"));
    EXPECT_TRUE(transport.accepted.empty());
}

TEST_F(ApprovalWorkflowTest, FinalStatusesDoNotChange) {
    requestUpload("req1");
    changeStatus("req1", ApprovalStatus::kRejected);
    changeStatus("req1", ApprovalStatus::kAccepted);
    EXPECT_EQ(item("req1").approval_status, ApprovalStatus::kRejected);
    EXPECT_EQ(store.GetRequest("req1")->status, ApprovalStatus::kRejected);
}

TEST_F(ApprovalWorkflowTest, StatusChangeForUnseenRequestCreatesItem) {
    changeStatus("req9", ApprovalStatus::kAccepted);
    EXPECT_EQ(item("req9").approval_status, ApprovalStatus::kAccepted);
    EXPECT_EQ(item("req9").counterpart_label, "192.168.1.30");
}

TEST_F(ApprovalWorkflowTest, RemoveKeepsItem) {
    requestUpload("req1");
    approval.Remove(RelayChannel::kUpload, "req1");

    EXPECT_EQ(transport.removed, std::vector<std::string>{"req1"});
    EXPECT_FALSE(store.GetRequest("req1").has_value());
    EXPECT_TRUE(board.Contains(TaskItemId{TaskOrigin::kRelayUpload, "req1"}));
}

TEST_F(ApprovalWorkflowTest, RemovedEventDropsRequest) {
    requestUpload("req1");
    reconciler.Handle(RelayRequestEvent{
        .kind = RelayRequestEvent::Kind::kRemoved,
        .channel = RelayChannel::kUpload,
        .request_id = "req1",
    });
    EXPECT_FALSE(store.GetRequest("req1").has_value());
    EXPECT_TRUE(transport.removed.empty());
}

TEST_F(ApprovalWorkflowTest, ClearForwardsChannel) {
    requestUpload("req1");
    requestUpload("req2");
    approval.Clear(RelayChannel::kUpload);

    EXPECT_EQ(transport.cleared, std::vector<RelayChannel>{RelayChannel::kUpload});
    EXPECT_TRUE(store.ListRequests(RelayChannel::kUpload).empty());
}
