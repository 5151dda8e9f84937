#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace puresend::ipc::operation {

struct RemoveHistory {
    std::vector<std::string> ids;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RemoveHistory, ids);
};

} // namespace puresend::ipc::operation
