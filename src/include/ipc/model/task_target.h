#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace puresend::ipc::operation {

// Task as shown in the front end: "p2p-<id>" or "web-<id>", and the list it sits in
struct TaskTarget {
    std::string task_id;
    std::string side; // "send" | "receive"

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TaskTarget, task_id, side);
};

} // namespace puresend::ipc::operation
