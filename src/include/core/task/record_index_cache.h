#pragma once

#include <core/model/task_item.h>
#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

namespace puresend::core {

// Where a relay transfer record landed: the item and the position in its file list
struct FileLocation {
    TaskItemId item;
    std::size_t index{0};
};

// Bounded LRU map from record id to FileLocation
class RecordIndexCache {
public:
    explicit RecordIndexCache(std::size_t capacity);

    void Put(const std::string& record_id, FileLocation location);

    // Marks the entry as most recently used
    std::optional<FileLocation> Get(const std::string& record_id);

    // Drops every entry pointing into `item`
    std::size_t EraseItem(const TaskItemId& item);

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }

private:
    using Entry = std::pair<std::string, FileLocation>;

    std::size_t capacity_;
    std::list<Entry> entries_; // front: most recent
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

} // namespace puresend::core
