#pragma once

#include <core/model/task_item.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace puresend::core {

/**
 * @brief Owner of the UnifiedTaskItems that come from relay requests
 *
 * @details Relay-upload items belong to the receive side, relay-download items to the
 * send side. Direct tasks are not stored here, they are projected from the TaskStore on
 * every read.
 */
class TaskItemBoard {
public:
    TaskItemBoard() = default;
    TaskItemBoard(const TaskItemBoard&) = delete;
    TaskItemBoard& operator=(const TaskItemBoard&) = delete;

    // Returns the existing item, or creates an empty one stamped with `now`
    UnifiedTaskItem& Ensure(const TaskItemId& id,
                            const std::string& label,
                            const std::string& address,
                            Millis now);

    UnifiedTaskItem* Find(const TaskItemId& id);
    std::optional<UnifiedTaskItem> Get(const TaskItemId& id) const;
    bool Contains(const TaskItemId& id) const;

    // Newest item (by insertion) of `origin` whose counterpart address matches
    UnifiedTaskItem* FindLatestByAddress(TaskOrigin origin, const std::string& address);

    bool Remove(const TaskItemId& id);

    // Removes items of `origin` whose transfer finished or was cancelled
    std::vector<TaskItemId> RemoveFinished(TaskOrigin origin);

    std::vector<UnifiedTaskItem> List(TaskOrigin origin) const;

private:
    std::map<TaskItemId, UnifiedTaskItem> items_;
    std::uint64_t next_sequence_{1};
};

} // namespace puresend::core
