#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace puresend::ipc::operation {

// key is the TOML key without its table, e.g. "record-history"
struct ModifySettings {
    std::string key;
    nlohmann::json value;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ModifySettings, key, value);
};

} // namespace puresend::ipc::operation
