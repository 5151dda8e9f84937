#pragma once

#include "feedback_type.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace puresend::core {

struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

using FeedbackCallback = std::function<void(Feedback&&)>;

} // namespace puresend::core
