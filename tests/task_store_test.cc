#include <core/task/task_store.h>
#include <gtest/gtest.h>

using namespace puresend::core;

namespace {

TaskDescriptor archive(std::string id = "t1") {
    return TaskDescriptor{
        .id = std::move(id),
        .file = {.name = "a.zip", .size = 1000},
        .direction = TransferDirection::kSend,
        .peer = {.id = "peer-1", .address = "192.168.1.20", .port = 53317, .name = "Laptop"},
    };
}

} // namespace

class TaskStoreTest : public ::testing::Test {
protected:
    TaskStore store;
};

TEST_F(TaskStoreTest, CreateProgressComplete) {
    std::vector<std::string> completed;
    store.SetCompletedCallback([&](const TransferTask& task) { completed.push_back(task.id); });

    auto id = store.CreateTask(archive());
    ASSERT_EQ(store.Get(id)->status, TaskStatus::kPending);
    EXPECT_EQ(store.Get(id)->bytes_transferred, 0u);

    ASSERT_TRUE(store.ApplyProgress(id, 500, 1000));
    auto task = store.Get(id);
    EXPECT_EQ(task->status, TaskStatus::kTransferring);
    EXPECT_EQ(task->progress, 50);
    EXPECT_EQ(task->speed, 1000u);

    ASSERT_TRUE(store.ApplyTerminal(id, TaskStatus::kCompleted));
    task = store.Get(id);
    EXPECT_EQ(task->status, TaskStatus::kCompleted);
    EXPECT_EQ(task->progress, 100);
    EXPECT_EQ(task->bytes_transferred, 1000u);
    EXPECT_EQ(task->speed, 0u);
    EXPECT_TRUE(task->completed_at.has_value());
    EXPECT_EQ(completed, std::vector<std::string>{"t1"});
}

TEST_F(TaskStoreTest, BytesNeverGoBackwards) {
    auto id = store.CreateTask(archive());
    store.ApplyProgress(id, 600, 10);
    store.ApplyProgress(id, 400, 20);
    auto task = store.Get(id);
    EXPECT_EQ(task->bytes_transferred, 600u);
    EXPECT_EQ(task->progress, 60);
    EXPECT_EQ(task->speed, 20u);

    store.ApplyProgress(id, 5000, 20);
    EXPECT_EQ(store.Get(id)->bytes_transferred, 1000u);
}

TEST_F(TaskStoreTest, UnknownTaskIsIgnored) {
    store.CreateTask(archive());
    auto before = store.List();

    EXPECT_FALSE(store.ApplyProgress("ghost", 100, 10));
    EXPECT_FALSE(store.ApplyTerminal("ghost", TaskStatus::kFailed, "boom"));
    EXPECT_FALSE(store.ApplyInterrupted("ghost", 10, "lost"));

    auto after = store.List();
    ASSERT_EQ(after.size(), before.size());
    EXPECT_EQ(after[0].status, before[0].status);
    EXPECT_FALSE(store.Contains("ghost"));
}

TEST_F(TaskStoreTest, TerminalStatusIsFinal) {
    auto id = store.CreateTask(archive());
    store.ApplyProgress(id, 100, 10);
    ASSERT_TRUE(store.ApplyTerminal(id, TaskStatus::kCompleted));
    auto completed_at = store.Get(id)->completed_at;

    EXPECT_FALSE(store.ApplyTerminal(id, TaskStatus::kCompleted));
    EXPECT_FALSE(store.ApplyTerminal(id, TaskStatus::kFailed, "late"));
    EXPECT_FALSE(store.ApplyProgress(id, 200, 10));

    auto task = store.Get(id);
    EXPECT_EQ(task->status, TaskStatus::kCompleted);
    EXPECT_EQ(task->completed_at, completed_at);
    EXPECT_FALSE(task->error.has_value());
}

TEST_F(TaskStoreTest, FailureKeepsBytesAndRecordsError) {
    auto id = store.CreateTask(archive());
    store.ApplyProgress(id, 300, 10);
    ASSERT_TRUE(store.ApplyTerminal(id, TaskStatus::kFailed, "connection reset"));

    auto task = store.Get(id);
    EXPECT_EQ(task->status, TaskStatus::kFailed);
    EXPECT_EQ(task->bytes_transferred, 300u);
    EXPECT_EQ(task->error, "connection reset");
}

TEST_F(TaskStoreTest, NonTerminalStatusIsRefused) {
    auto id = store.CreateTask(archive());
    EXPECT_FALSE(store.ApplyTerminal(id, TaskStatus::kTransferring));
    EXPECT_EQ(store.Get(id)->status, TaskStatus::kPending);
}

TEST_F(TaskStoreTest, InterruptAndResume) {
    auto id = store.CreateTask(archive());
    store.ApplyProgress(id, 400, 10);
    ASSERT_TRUE(store.ApplyInterrupted(id, 400, "peer went away"));

    auto task = store.Get(id);
    EXPECT_EQ(task->status, TaskStatus::kInterrupted);
    EXPECT_TRUE(task->resumable);
    EXPECT_EQ(task->resume_offset, 400u);
    EXPECT_EQ(task->error, "peer went away");

    // progress is not accepted while interrupted
    EXPECT_FALSE(store.ApplyProgress(id, 500, 10));

    ASSERT_TRUE(store.MarkResuming(id));
    task = store.Get(id);
    EXPECT_EQ(task->status, TaskStatus::kTransferring);
    EXPECT_FALSE(task->error.has_value());
    EXPECT_FALSE(task->resumable);
    EXPECT_TRUE(task->resumed);
    EXPECT_FALSE(store.MarkResuming(id));
}

TEST_F(TaskStoreTest, DuplicateCreateKeepsRecord) {
    auto id = store.CreateTask(archive());
    store.ApplyProgress(id, 100, 10);
    store.CreateTask(archive());
    EXPECT_EQ(store.Get(id)->bytes_transferred, 100u);
    EXPECT_EQ(store.List().size(), 1u);
}

TEST_F(TaskStoreTest, RemoveFinishedKeepsFailedAndActive) {
    auto done = store.CreateTask(archive("done"));
    auto cancelled = store.CreateTask(archive("cancelled"));
    auto failed = store.CreateTask(archive("failed"));
    auto active = store.CreateTask(archive("active"));
    store.ApplyTerminal(done, TaskStatus::kCompleted);
    store.ApplyTerminal(cancelled, TaskStatus::kCancelled);
    store.ApplyTerminal(failed, TaskStatus::kFailed, "disk full");
    store.ApplyProgress(active, 10, 1);

    auto removed = store.RemoveFinished();
    EXPECT_EQ(removed.size(), 2u);

    auto remaining = store.List();
    ASSERT_EQ(remaining.size(), 2u);
    EXPECT_EQ(remaining[0].id, "failed");
    EXPECT_EQ(remaining[1].id, "active");
}

TEST_F(TaskStoreTest, ListFiltersByDirection) {
    store.CreateTask(archive("out"));
    auto incoming = archive("in");
    incoming.direction = TransferDirection::kReceive;
    store.CreateTask(incoming);

    auto received = store.List(TransferDirection::kReceive);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].id, "in");
}

TEST_F(TaskStoreTest, RequestTransitions) {
    AccessRequest request{
        .id = "req1",
        .channel = RelayChannel::kUpload,
        .address = "192.168.1.30",
        .client_id = "Mozilla/5.0 (Linux; Android 14) Chrome/126.0 Mobile Safari/537.36",
        .requested_at = 1000,
    };
    auto stored = store.UpsertRequest(request);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->label, "Chrome(Android)");

    EXPECT_TRUE(store.SetRequestStatus("req1", ApprovalStatus::kAccepted));
    EXPECT_TRUE(store.SetRequestStatus("req1", ApprovalStatus::kExpired));
    EXPECT_FALSE(store.SetRequestStatus("req1", ApprovalStatus::kAccepted));
    EXPECT_EQ(store.GetRequest("req1")->status, ApprovalStatus::kExpired);

    request.status = ApprovalStatus::kPending;
    EXPECT_FALSE(store.UpsertRequest(request).has_value());
}

TEST_F(TaskStoreTest, LatestRequestForAddress) {
    store.UpsertRequest({.id = "old", .channel = RelayChannel::kDownload, .address = "10.0.0.5", .requested_at = 100});
    store.UpsertRequest({.id = "new", .channel = RelayChannel::kDownload, .address = "10.0.0.5", .requested_at = 200});
    store.UpsertRequest({.id = "other", .channel = RelayChannel::kDownload, .address = "10.0.0.6", .requested_at = 300});
    store.UpsertRequest({.id = "upload", .channel = RelayChannel::kUpload, .address = "10.0.0.5", .requested_at = 400});

    auto latest = store.FindLatestRequest(RelayChannel::kDownload, "10.0.0.5");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->id, "new");
    EXPECT_FALSE(store.FindLatestRequest(RelayChannel::kDownload, "10.0.0.7").has_value());

    auto cleared = store.ClearRequests(RelayChannel::kDownload);
    EXPECT_EQ(cleared.size(), 3u);
    EXPECT_TRUE(store.GetRequest("upload").has_value());
}

TEST_F(TaskStoreTest, RequestRecordsAreUpserted) {
    store.UpsertRequest({.id = "req1", .channel = RelayChannel::kUpload, .address = "10.0.0.5"});
    TransferRecord record{.id = "rec1", .file_name = "b.txt", .bytes_transferred = 10, .total_bytes = 200};
    EXPECT_TRUE(store.UpsertRequestRecord("req1", record));
    record.bytes_transferred = 200;
    record.status = TaskStatus::kCompleted;
    EXPECT_TRUE(store.UpsertRequestRecord("req1", record));
    EXPECT_FALSE(store.UpsertRequestRecord("missing", record));

    auto request = store.GetRequest("req1");
    ASSERT_EQ(request->records.size(), 1u);
    EXPECT_EQ(request->records[0].status, TaskStatus::kCompleted);
}
