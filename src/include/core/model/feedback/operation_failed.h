#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace puresend::core::feedback {

struct OperationFailed {
    std::string operation;
    std::string message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(OperationFailed, operation, message);
};

} // namespace puresend::core::feedback
