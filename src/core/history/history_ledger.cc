#include <algorithm>
#include <core/history/history_ledger.h>
#include <fstream>
#include <numeric>
#include <spdlog/spdlog.h>
#include <system_error>
#include <unordered_set>

using json = nlohmann::json;

namespace puresend::core {

namespace fs = std::filesystem;

HistoryLedger::HistoryLedger(fs::path file, std::size_t max_count)
    : file_(std::move(file))
    , max_count_(max_count == 0 ? transfer::kDefaultMaxHistoryCount : max_count) {}

bool HistoryLedger::Load() {
    items_.clear();
    unreadable_.clear();
    dirty_ = false;
    writable_ = true;

    std::error_code ec;
    auto exists = fs::exists(file_, ec);
    if (ec) {
        spdlog::error("Cannot inspect history file \"{}\": {}", file_.string(), ec.message());
        writable_ = false;
        return false;
    }
    if (!exists) {
        spdlog::info("No history file at \"{}\", starting empty", file_.string());
        return true;
    }

    std::ifstream ifs(file_);
    if (!ifs.is_open()) {
        // 文件存在但读不了，不能用空列表覆盖它
        spdlog::error("Failed to open \"{}\" for reading history, saving disabled", file_.string());
        writable_ = false;
        return false;
    }

    std::optional<HistoryDocument> document;
    try {
        document = ParseDocument(json::parse(ifs));
    } catch (const json::exception& e) {
        spdlog::error("History file \"{}\" is not valid JSON: {}", file_.string(), e.what());
    }
    ifs.close();

    if (!document) {
        auto corrupt = file_;
        corrupt += ".corrupt";
        fs::rename(file_, corrupt, ec);
        if (ec) {
            spdlog::error("Failed to move corrupt history file aside, saving disabled: {}",
                          ec.message());
            writable_ = false;
        } else {
            spdlog::warn("Corrupt history file moved to \"{}\"", corrupt.string());
        }
        return false;
    }

    if (document->version > transfer::kHistoryStorageVersion) {
        spdlog::warn("History file \"{}\" has version {}, newer than {}; it is kept read-only",
                     file_.string(),
                     document->version,
                     transfer::kHistoryStorageVersion);
        writable_ = false;
    } else if (document->version < transfer::kHistoryStorageVersion) {
        *document = Migrate(std::move(*document));
        dirty_ = true;
    }

    unreadable_ = std::move(document->unreadable);
    std::unordered_set<std::string> seen;
    for (auto& item : document->items) {
        if (seen.insert(item.id).second) {
            items_.push_back(std::move(item));
        } else {
            spdlog::warn("Duplicate history id {} kept aside", item.id);
            unreadable_.emplace_back(item);
        }
    }
    if (!unreadable_.empty()) {
        spdlog::warn("{} history entr(ies) could not be read and are kept unchanged",
                     unreadable_.size());
    }
    keepNewest(max_count_);
    spdlog::info("Loaded {} history item(s) from \"{}\"", items_.size(), file_.string());
    return true;
}

bool HistoryLedger::Save() {
    if (!writable_) {
        spdlog::warn("History file \"{}\" is not rewritten, changes stay in memory",
                     file_.string());
        dirty_ = true;
        return false;
    }

    std::error_code ec;
    if (file_.has_parent_path() && !fs::exists(file_.parent_path(), ec)) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create history directory \"{}\": {}",
                          file_.parent_path().string(),
                          ec.message());
            dirty_ = true;
            return false;
        }
    }

    auto temp = file_;
    temp += ".tmp";
    {
        std::ofstream ofs(temp, std::ios::trunc);
        if (!ofs.is_open()) {
            spdlog::error("Failed to open \"{}\" for saving history", temp.string());
            dirty_ = true;
            return false;
        }
        ofs << ToDocument().dump(2);
        if (!ofs.good()) {
            spdlog::error("Failed to write history to \"{}\"", temp.string());
            dirty_ = true;
            return false;
        }
    }

    fs::rename(temp, file_, ec);
    if (ec) {
        spdlog::error("Failed to replace history file \"{}\": {}", file_.string(), ec.message());
        fs::remove(temp, ec);
        dirty_ = true;
        return false;
    }
    dirty_ = false;
    spdlog::debug("Saved {} history item(s)", items_.size());
    return true;
}

bool HistoryLedger::Append(HistoryItem item) {
    auto exists = std::any_of(items_.begin(), items_.end(), [&](const HistoryItem& h) {
        return h.id == item.id;
    });
    if (exists) {
        spdlog::debug("History item {} already recorded", item.id);
        return false;
    }
    items_.insert(items_.begin(), std::move(item));
    keepNewest(max_count_);
    dirty_ = true;
    return true;
}

bool HistoryLedger::Remove(const std::string& id) {
    auto it = std::find_if(items_.begin(), items_.end(), [&](const HistoryItem& h) {
        return h.id == id;
    });
    if (it == items_.end()) {
        return false;
    }
    items_.erase(it);
    dirty_ = true;
    return true;
}

std::size_t HistoryLedger::RemoveMany(const std::vector<std::string>& ids) {
    std::unordered_set<std::string> targets(ids.begin(), ids.end());
    auto removed = std::erase_if(items_, [&](const HistoryItem& h) {
        return targets.contains(h.id);
    });
    if (removed > 0) {
        dirty_ = true;
    }
    return removed;
}

void HistoryLedger::Clear() {
    items_.clear();
    unreadable_.clear();
    dirty_ = true;
}

std::vector<HistoryItem> HistoryLedger::List(const HistoryFilter& filter,
                                             const HistorySort& sort) const {
    std::vector<HistoryItem> result;
    for (const auto& item : items_) {
        if (filter.direction && item.direction != *filter.direction) {
            continue;
        }
        if (filter.status && item.status != *filter.status) {
            continue;
        }
        result.push_back(item);
    }

    auto ascending = [&sort](const HistoryItem& a, const HistoryItem& b) {
        switch (sort.field) {
        case HistorySort::Field::kCompletedAt:
            return a.completed_at < b.completed_at;
        case HistorySort::Field::kFileName:
            return a.file_name < b.file_name;
        case HistorySort::Field::kFileSize:
            return a.file_size < b.file_size;
        }
        return false;
    };
    if (sort.order == HistorySort::Order::kAscending) {
        std::stable_sort(result.begin(), result.end(), ascending);
    } else {
        std::stable_sort(result.begin(), result.end(), [&](const auto& a, const auto& b) {
            return ascending(b, a);
        });
    }
    return result;
}

std::size_t HistoryLedger::ApplyRetention(const RetentionPolicy& policy, Millis now) {
    std::size_t removed = 0;
    switch (policy.strategy) {
    case CleanupStrategy::kDisabled:
        return 0;
    case CleanupStrategy::kByTime: {
        if (policy.retention_days == 0) {
            return 0;
        }
        auto cutoff = now - static_cast<Millis>(policy.retention_days) * transfer::kMillisPerDay;
        removed = std::erase_if(items_, [cutoff](const HistoryItem& h) {
            return h.completed_at < cutoff;
        });
        break;
    }
    case CleanupStrategy::kByCount:
        if (policy.max_count == 0) {
            return 0;
        }
        removed = keepNewest(policy.max_count);
        break;
    }
    if (removed > 0) {
        dirty_ = true;
        spdlog::info("History retention removed {} item(s)", removed);
    }
    return removed;
}

void HistoryLedger::SetMaxCount(std::size_t max_count) {
    max_count_ = max_count == 0 ? transfer::kDefaultMaxHistoryCount : max_count;
    if (keepNewest(max_count_) > 0) {
        dirty_ = true;
    }
}

json HistoryLedger::ToDocument() const {
    json items = items_;
    for (const auto& entry : unreadable_) {
        items.push_back(entry);
    }
    return json{
        {"version", transfer::kHistoryStorageVersion},
        {"items", std::move(items)},
    };
}

std::optional<HistoryDocument> HistoryLedger::ParseDocument(const json& document) {
    const json* items = nullptr;
    HistoryDocument result;
    if (document.is_array()) {
        result.version = 0;
        items = &document;
    } else if (document.is_object() && document.contains("items")
               && document["items"].is_array()) {
        result.version = document.value("version", 0);
        items = &document["items"];
    } else {
        return std::nullopt;
    }

    for (const auto& entry : *items) {
        if (auto item = ReadHistoryItem(entry); item) {
            result.items.push_back(std::move(*item));
        } else {
            result.unreadable.push_back(entry);
        }
    }
    return result;
}

HistoryDocument HistoryLedger::Migrate(HistoryDocument document) {
    if (document.version >= transfer::kHistoryStorageVersion) {
        return document;
    }
    spdlog::info("Migrating history from version {} to {}",
                 document.version,
                 transfer::kHistoryStorageVersion);
    // 0 -> 1: envelope added. Legacy item keys are already mapped by from_json.
    document.version = transfer::kHistoryStorageVersion;
    return document;
}

std::size_t HistoryLedger::keepNewest(std::size_t count) {
    if (items_.size() <= count) {
        return 0;
    }
    std::vector<std::size_t> order(items_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        return items_[a].completed_at > items_[b].completed_at;
    });

    std::vector<bool> keep(items_.size(), false);
    for (std::size_t i = 0; i < count; ++i) {
        keep[order[i]] = true;
    }
    std::vector<HistoryItem> kept;
    kept.reserve(count);
    for (std::size_t i = 0; i < items_.size(); ++i) {
        if (keep[i]) {
            kept.push_back(std::move(items_[i]));
        }
    }
    auto removed = items_.size() - kept.size();
    items_ = std::move(kept);
    return removed;
}

} // namespace puresend::core
