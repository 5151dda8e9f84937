#include <core/history/history_ledger.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>

using namespace puresend::core;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

HistoryItem makeItem(std::string id, Millis completed_at, std::string name = "file.bin") {
    return HistoryItem{
        .id = std::move(id),
        .file_name = std::move(name),
        .file_size = 100,
        .peer_name = "Alice",
        .peer_address = "192.168.1.20",
        .status = TaskStatus::kCompleted,
        .direction = TransferDirection::kSend,
        .completed_at = completed_at,
        .mode = TransferMode::kDirect,
    };
}

std::vector<std::string> ids(const std::vector<HistoryItem>& items) {
    std::vector<std::string> result;
    for (const auto& item : items) {
        result.push_back(item.id);
    }
    return result;
}

} // namespace

class HistoryLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "puresend-tests"
               / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path file() const { return dir_ / "history.json"; }

    void writeFile(const std::string& content) const {
        std::ofstream ofs(file(), std::ios::trunc);
        ofs << content;
    }

    fs::path dir_;
};

TEST_F(HistoryLedgerTest, AppendIsIdempotentAndNewestFirst) {
    HistoryLedger ledger(file());
    EXPECT_TRUE(ledger.Append(makeItem("a", 100)));
    EXPECT_TRUE(ledger.Append(makeItem("b", 200)));
    EXPECT_FALSE(ledger.Append(makeItem("a", 300)));

    EXPECT_EQ(ids(ledger.items()), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(ledger.items()[1].completed_at, 100);
    EXPECT_TRUE(ledger.dirty());
}

TEST_F(HistoryLedgerTest, HardCapKeepsNewest) {
    HistoryLedger ledger(file(), 3);
    for (int i = 1; i <= 5; ++i) {
        ledger.Append(makeItem(std::to_string(i), i * 100));
    }
    EXPECT_EQ(ids(ledger.items()), (std::vector<std::string>{"5", "4", "3"}));

    ledger.SetMaxCount(2);
    EXPECT_EQ(ids(ledger.items()), (std::vector<std::string>{"5", "4"}));
}

TEST_F(HistoryLedgerTest, RetentionByCount) {
    HistoryLedger ledger(file());
    for (int i = 1; i <= 5; ++i) {
        ledger.Append(makeItem(std::to_string(i), i * 100));
    }
    EXPECT_EQ(ledger.ApplyRetention(RetentionPolicy::ByCount(3), NowMillis()), 2u);
    EXPECT_EQ(ids(ledger.items()), (std::vector<std::string>{"5", "4", "3"}));

    EXPECT_EQ(ledger.ApplyRetention(RetentionPolicy::ByCount(3), NowMillis()), 0u);
}

TEST_F(HistoryLedgerTest, RetentionByTime) {
    auto now = NowMillis();
    HistoryLedger ledger(file());
    ledger.Append(makeItem("old", now - 10 * transfer::kMillisPerDay));
    ledger.Append(makeItem("edge", now - 7 * transfer::kMillisPerDay));
    ledger.Append(makeItem("recent", now - transfer::kMillisPerDay));

    EXPECT_EQ(ledger.ApplyRetention(RetentionPolicy::ByTime(7), now), 1u);
    EXPECT_EQ(ids(ledger.items()), (std::vector<std::string>{"recent", "edge"}));
}

TEST_F(HistoryLedgerTest, DisabledRetentionKeepsEverything) {
    HistoryLedger ledger(file());
    ledger.Append(makeItem("a", 1));
    EXPECT_EQ(ledger.ApplyRetention(RetentionPolicy::Disabled(), NowMillis()), 0u);
    EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(HistoryLedgerTest, RemoveAndClear) {
    HistoryLedger ledger(file());
    ledger.Append(makeItem("a", 1));
    ledger.Append(makeItem("b", 2));
    ledger.Append(makeItem("c", 3));

    EXPECT_TRUE(ledger.Remove("b"));
    EXPECT_FALSE(ledger.Remove("b"));
    EXPECT_EQ(ledger.RemoveMany({"a", "missing"}), 1u);
    EXPECT_EQ(ids(ledger.items()), std::vector<std::string>{"c"});

    ledger.Clear();
    EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(HistoryLedgerTest, FilterAndSort) {
    HistoryLedger ledger(file());
    auto received = makeItem("r1", 300, "b.txt");
    received.direction = TransferDirection::kReceive;
    received.file_size = 50;
    auto failed = makeItem("s2", 200, "c.txt");
    failed.status = TaskStatus::kFailed;
    failed.error = "disk full";
    ledger.Append(makeItem("s1", 100, "a.txt"));
    ledger.Append(failed);
    ledger.Append(received);

    EXPECT_EQ(ids(ledger.List()), (std::vector<std::string>{"r1", "s2", "s1"}));
    EXPECT_EQ(ids(ledger.List({.direction = TransferDirection::kSend})),
              (std::vector<std::string>{"s2", "s1"}));
    EXPECT_EQ(ids(ledger.List({.status = TaskStatus::kFailed})), std::vector<std::string>{"s2"});

    HistorySort by_name{.field = HistorySort::Field::kFileName,
                        .order = HistorySort::Order::kAscending};
    EXPECT_EQ(ids(ledger.List({}, by_name)), (std::vector<std::string>{"s1", "r1", "s2"}));

    HistorySort by_size{.field = HistorySort::Field::kFileSize,
                        .order = HistorySort::Order::kAscending};
    EXPECT_EQ(ids(ledger.List({}, by_size)).front(), "r1");
}

TEST_F(HistoryLedgerTest, DocumentShape) {
    HistoryLedger ledger(file());
    auto item = makeItem("a", 100);
    item.peer_address = std::nullopt;
    ledger.Append(item);

    auto document = ledger.ToDocument();
    EXPECT_EQ(document["version"], transfer::kHistoryStorageVersion);
    ASSERT_EQ(document["items"].size(), 1u);
    const auto& entry = document["items"][0];
    EXPECT_EQ(entry["fileName"], "file.bin");
    EXPECT_EQ(entry["status"], "completed");
    EXPECT_EQ(entry["mode"], "direct");
    EXPECT_FALSE(entry.contains("peerAddress"));
    EXPECT_FALSE(entry.contains("error"));

    auto parsed = HistoryLedger::ParseDocument(document);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->version, transfer::kHistoryStorageVersion);
    ASSERT_EQ(parsed->items.size(), 1u);
    EXPECT_EQ(parsed->items[0], item);
}

TEST_F(HistoryLedgerTest, LegacyArrayIsMigrated) {
    auto legacy = json::parse(R"([
        {"id": "x1", "fileName": "a.txt", "fileSize": 10, "peerName": "Bob",
         "peerIp": "10.0.0.5", "status": "completed", "direction": "receive",
         "completedAt": 1000, "mode": "local"},
        {"fileName": "no id"},
        {"id": "x2", "fileName": "b.txt", "completedAt": 2000}
    ])");

    auto parsed = HistoryLedger::ParseDocument(legacy);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->version, 0);
    ASSERT_EQ(parsed->items.size(), 2u);
    EXPECT_EQ(parsed->items[0].peer_address, "10.0.0.5");
    EXPECT_EQ(parsed->items[0].mode, TransferMode::kDirect);
    EXPECT_EQ(parsed->items[0].direction, TransferDirection::kReceive);
    EXPECT_EQ(parsed->items[1].status, TaskStatus::kCompleted);
    EXPECT_FALSE(parsed->items[1].mode.has_value());

    ASSERT_EQ(parsed->unreadable.size(), 1u);
    EXPECT_EQ(parsed->unreadable[0], legacy[1]);

    auto migrated = HistoryLedger::Migrate(std::move(*parsed));
    EXPECT_EQ(migrated.version, transfer::kHistoryStorageVersion);
    EXPECT_EQ(migrated.items.size() + migrated.unreadable.size(), legacy.size());
}

TEST_F(HistoryLedgerTest, EntriesThatCannotBeRepresentedAreUnreadable) {
    auto parsed = HistoryLedger::ParseDocument(json::parse(R"([
        {"id": "a", "status": "paused"},
        {"id": "b", "fileSize": "20"},
        {"id": "c", "mode": "carrier-pigeon"},
        {"id": "d", "fileSize": -1},
        {"id": ""},
        "not an object",
        {"id": "ok", "status": "failed", "direction": "receive", "mode": "relay"}
    ])"));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->items.size(), 1u);
    EXPECT_EQ(parsed->items[0].id, "ok");
    EXPECT_EQ(parsed->unreadable.size(), 6u);
}

TEST_F(HistoryLedgerTest, UnknownKeysSurviveRewrite) {
    auto entry = json::parse(R"({"id": "a", "completedAt": 5, "checksum": "abc",
                                 "peerAddress": "10.0.0.1", "peerIp": "10.0.0.9"})");
    auto item = entry.get<HistoryItem>();
    EXPECT_EQ(item.peer_address, "10.0.0.1");

    json written = item;
    EXPECT_EQ(written["checksum"], "abc");
    EXPECT_EQ(written["peerIp"], "10.0.0.9");
    EXPECT_EQ(written["peerAddress"], "10.0.0.1");
}

TEST_F(HistoryLedgerTest, UnknownShapeIsRejected) {
    EXPECT_FALSE(HistoryLedger::ParseDocument(json::parse(R"({"version": 1})")).has_value());
    EXPECT_FALSE(HistoryLedger::ParseDocument(json("text")).has_value());
}

TEST_F(HistoryLedgerTest, SaveAndLoad) {
    {
        HistoryLedger ledger(dir_ / "nested" / "history.json");
        ledger.Append(makeItem("a", 100));
        ledger.Append(makeItem("b", 200));
        ASSERT_TRUE(ledger.Save());
        EXPECT_FALSE(ledger.dirty());
        EXPECT_FALSE(fs::exists(dir_ / "nested" / "history.json.tmp"));
    }

    HistoryLedger ledger(dir_ / "nested" / "history.json");
    ASSERT_TRUE(ledger.Load());
    EXPECT_EQ(ids(ledger.items()), (std::vector<std::string>{"b", "a"}));
    EXPECT_FALSE(ledger.dirty());
}

TEST_F(HistoryLedgerTest, MissingFileLoadsEmpty) {
    HistoryLedger ledger(file());
    EXPECT_TRUE(ledger.Load());
    EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(HistoryLedgerTest, LoadMigratesLegacyFile) {
    writeFile(R"([{"id": "x1", "completedAt": 5}, {"id": "x1", "completedAt": 6}])");

    HistoryLedger ledger(file());
    ASSERT_TRUE(ledger.Load());
    ASSERT_EQ(ledger.size(), 1u);
    EXPECT_EQ(ledger.items()[0].completed_at, 5);
    EXPECT_TRUE(ledger.dirty());

    ASSERT_TRUE(ledger.Save());
    std::ifstream ifs(file());
    auto saved = json::parse(ifs);
    EXPECT_EQ(saved["version"], transfer::kHistoryStorageVersion);
    // the duplicate is kept aside, not dropped
    ASSERT_EQ(saved["items"].size(), 2u);
    EXPECT_EQ(saved["items"][1]["completedAt"], 6);
}

TEST_F(HistoryLedgerTest, LegacyFileLosesNothingOnDisk) {
    writeFile(R"([
        {"id": "a", "fileName": "a.txt", "completedAt": 100},
        {"id": "b", "fileName": "b.txt", "fileSize": "20", "completedAt": 200},
        {"fileName": "c.txt", "completedAt": 300}
    ])");

    HistoryLedger ledger(file());
    ASSERT_TRUE(ledger.Load());
    EXPECT_EQ(ledger.size(), 1u);
    EXPECT_EQ(ledger.unreadable().size(), 2u);
    EXPECT_TRUE(ledger.dirty());
    ASSERT_TRUE(ledger.Save());

    std::ifstream ifs(file());
    auto saved = json::parse(ifs);
    EXPECT_EQ(saved["version"], transfer::kHistoryStorageVersion);
    ASSERT_EQ(saved["items"].size(), 3u);
    EXPECT_EQ(saved["items"][0]["id"], "a");
    EXPECT_EQ(saved["items"][1]["fileSize"], "20");
    EXPECT_EQ(saved["items"][2]["fileName"], "c.txt");
    EXPECT_FALSE(saved["items"][2].contains("id"));

    // and again on the next load
    HistoryLedger reloaded(file());
    ASSERT_TRUE(reloaded.Load());
    EXPECT_EQ(reloaded.size(), 1u);
    EXPECT_EQ(reloaded.unreadable().size(), 2u);
    EXPECT_FALSE(reloaded.dirty());
}

TEST_F(HistoryLedgerTest, NewerFileIsNeverRewritten) {
    const std::string content =
        R"({"version": 7, "items": [{"id": "a", "completedAt": 1, "checksum": "x"}]})";
    writeFile(content);

    HistoryLedger ledger(file());
    ASSERT_TRUE(ledger.Load());
    EXPECT_FALSE(ledger.writable());
    EXPECT_FALSE(ledger.dirty());
    ASSERT_EQ(ledger.size(), 1u);

    ledger.Append(makeItem("b", 2));
    EXPECT_FALSE(ledger.Save());
    EXPECT_TRUE(ledger.dirty());

    std::ifstream ifs(file());
    std::string on_disk((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    EXPECT_EQ(on_disk, content);
}

TEST_F(HistoryLedgerTest, ClearDropsUnreadableEntries) {
    writeFile(R"({"version": 1, "items": [{"id": "a"}, {"broken": true}]})");
    HistoryLedger ledger(file());
    ASSERT_TRUE(ledger.Load());
    ASSERT_EQ(ledger.unreadable().size(), 1u);

    ledger.Clear();
    ASSERT_TRUE(ledger.Save());
    std::ifstream ifs(file());
    EXPECT_TRUE(json::parse(ifs)["items"].empty());
}

TEST_F(HistoryLedgerTest, CorruptFileIsMovedAside) {
    writeFile("{ not json");

    HistoryLedger ledger(file());
    EXPECT_FALSE(ledger.Load());
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_FALSE(fs::exists(file()));
    EXPECT_TRUE(fs::exists(dir_ / "history.json.corrupt"));
}
