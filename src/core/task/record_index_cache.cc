#include <core/task/record_index_cache.h>

namespace puresend::core {

RecordIndexCache::RecordIndexCache(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void RecordIndexCache::Put(const std::string& record_id, FileLocation location) {
    if (auto it = index_.find(record_id); it != index_.end()) {
        it->second->second = std::move(location);
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }
    entries_.emplace_front(record_id, std::move(location));
    index_[record_id] = entries_.begin();
    while (entries_.size() > capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
}

std::optional<FileLocation> RecordIndexCache::Get(const std::string& record_id) {
    auto it = index_.find(record_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
}

std::size_t RecordIndexCache::EraseItem(const TaskItemId& item) {
    std::size_t erased = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.item == item) {
            index_.erase(it->first);
            it = entries_.erase(it);
            ++erased;
        } else {
            ++it;
        }
    }
    return erased;
}

} // namespace puresend::core
