#pragma once

#include <core/constant/transfer.h>
#include <core/model/history_item.h>
#include <core/util/config.h>
#include <core/util/time.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace puresend::core {

// nullopt matches everything
struct HistoryFilter {
    std::optional<TransferDirection> direction;
    std::optional<TaskStatus> status;
};

struct HistorySort {
    enum class Field {
        kCompletedAt,
        kFileName,
        kFileSize,
    };
    enum class Order {
        kAscending,
        kDescending,
    };

    Field field{Field::kCompletedAt};
    Order order{Order::kDescending};
};

struct RetentionPolicy {
    CleanupStrategy strategy{CleanupStrategy::kDisabled};
    std::uint32_t retention_days{0};
    std::size_t max_count{0};

    static RetentionPolicy ByTime(std::uint32_t days) {
        return {.strategy = CleanupStrategy::kByTime, .retention_days = days};
    }
    static RetentionPolicy ByCount(std::size_t count) {
        return {.strategy = CleanupStrategy::kByCount, .max_count = count};
    }
    static RetentionPolicy Disabled() { return {}; }
};

/**
 * @brief Durable log of finished transfers
 *
 * @details Items are kept newest first and are unique by id. The ledger is written to a
 * single JSON document, {"version": N, "items": [...]}. Older documents (including the
 * bare array written by early versions) are migrated on load, before anything reads
 * them. Entries this version cannot read are carried along verbatim and written back
 * after the readable ones. Writes go to a temporary file that replaces the document, so
 * a crash never leaves a truncated file behind. A document that cannot be parsed is
 * moved aside to "<name>.corrupt".
 *
 * Saving is disabled for the rest of the session when the file could not be opened,
 * could not be moved aside, or was written by a newer version.
 */
class HistoryLedger {
public:
    explicit HistoryLedger(std::filesystem::path file,
                           std::size_t max_count = transfer::kDefaultMaxHistoryCount);
    HistoryLedger(const HistoryLedger&) = delete;
    HistoryLedger& operator=(const HistoryLedger&) = delete;

    // Replaces the in-memory items with the document on disk. A missing file loads as
    // empty; returns false when the file could not be read.
    bool Load();

    // Returns false and keeps the ledger dirty when the document cannot or may not be written
    bool Save();

    // Returns false when an item with the same id is already recorded
    bool Append(HistoryItem item);
    bool Remove(const std::string& id);
    std::size_t RemoveMany(const std::vector<std::string>& ids);
    void Clear();

    std::vector<HistoryItem> List(const HistoryFilter& filter = {},
                                  const HistorySort& sort = {}) const;

    // Returns the number of removed items
    std::size_t ApplyRetention(const RetentionPolicy& policy, Millis now);

    // Hard cap applied on every append
    void SetMaxCount(std::size_t max_count);

    const std::vector<HistoryItem>& items() const { return items_; }
    std::size_t size() const { return items_.size(); }
    const std::vector<nlohmann::json>& unreadable() const { return unreadable_; }
    bool writable() const { return writable_; }
    bool dirty() const { return dirty_; }
    const std::filesystem::path& file() const { return file_; }

    nlohmann::json ToDocument() const;

    // nullopt if `document` is neither a history document nor a legacy array
    static std::optional<HistoryDocument> ParseDocument(const nlohmann::json& document);

    // Brings an older document to kHistoryStorageVersion. Steps only add information;
    // newer documents are returned untouched.
    static HistoryDocument Migrate(HistoryDocument document);

private:
    // Keeps the `count` items with the latest completion time, in their current order
    std::size_t keepNewest(std::size_t count);

    std::filesystem::path file_;
    std::size_t max_count_;
    std::vector<HistoryItem> items_; // newest first
    std::vector<nlohmann::json> unreadable_;
    bool dirty_{false};
    bool writable_{true};
};

} // namespace puresend::core
