#include <core/task/resume_manager.h>
#include <gtest/gtest.h>
#include <utils/fake_transport.h>

using namespace puresend::core;

class ResumeManagerTest : public ::testing::Test {
protected:
    ResumeManagerTest()
        : resume_manager(store, transport) {}

    void SetUp() override {
        store.CreateTask({.id = "t1", .file = {.name = "video.mp4", .size = 1000}});
        store.ApplyProgress("t1", 400, 100);
        store.ApplyInterrupted("t1", 400, "connection reset");
    }

    puresend::test::FakeTransport transport;
    TaskStore store;
    ResumeManager resume_manager;
};

TEST_F(ResumeManagerTest, ResumeInterruptedTask) {
    ASSERT_TRUE(resume_manager.Resume("t1"));

    EXPECT_EQ(transport.resumed, std::vector<std::string>{"t1"});
    auto task = store.Get("t1");
    EXPECT_EQ(task->status, TaskStatus::kTransferring);
    EXPECT_TRUE(task->resumed);
    EXPECT_FALSE(task->error.has_value());
    EXPECT_EQ(task->bytes_transferred, 400u);
}

TEST_F(ResumeManagerTest, OnlyInterruptedTasksResume) {
    store.CreateTask({.id = "t2", .file = {.name = "a.txt", .size = 10}});
    EXPECT_FALSE(resume_manager.Resume("t2"));
    EXPECT_FALSE(resume_manager.Resume("missing"));

    ASSERT_TRUE(resume_manager.Resume("t1"));
    EXPECT_FALSE(resume_manager.Resume("t1"));
    EXPECT_EQ(transport.resumed.size(), 1u);
}

TEST_F(ResumeManagerTest, TransportFailureFailsTask) {
    transport.fail_resume = true;
    EXPECT_FALSE(resume_manager.Resume("t1"));

    auto task = store.Get("t1");
    EXPECT_EQ(task->status, TaskStatus::kFailed);
    EXPECT_EQ(task->error, "checkpoint expired");
    EXPECT_TRUE(task->completed_at.has_value());

    // failed is final
    transport.fail_resume = false;
    EXPECT_FALSE(resume_manager.Resume("t1"));
    EXPECT_TRUE(transport.resumed.empty());
}

TEST_F(ResumeManagerTest, ListComesFromTransport) {
    transport.resumable = {
        {.task_id = "t1", .file = {.name = "video.mp4", .size = 1000}, .resume_offset = 400},
    };
    auto list = resume_manager.ListResumable();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].task_id, "t1");
    EXPECT_EQ(list[0].resume_offset, 400u);
}

TEST_F(ResumeManagerTest, CleanupDiscardsOrphanedCheckpoints) {
    transport.resumable = {
        {.task_id = "t1", .resume_offset = 400},
        {.task_id = "gone-1", .resume_offset = 10},
        {.task_id = "gone-2", .resume_offset = 20},
    };

    EXPECT_EQ(resume_manager.Cleanup(), 2u);
    ASSERT_EQ(transport.cleaned.size(), 2u);
    EXPECT_EQ(transport.cleaned[0], std::optional<std::string>{"gone-1"});
    EXPECT_EQ(transport.cleaned[1], std::optional<std::string>{"gone-2"});
}

TEST_F(ResumeManagerTest, CleanupSingleCheckpoint) {
    EXPECT_EQ(resume_manager.Cleanup("t1"), 1u);
    ASSERT_EQ(transport.cleaned.size(), 1u);
    EXPECT_EQ(transport.cleaned[0], std::optional<std::string>{"t1"});
}
