#pragma once

#include <nlohmann/json.hpp>

namespace puresend::core {

enum class FeedbackType {
    kSendTasksChanged,    // 发送列表变化（完整的发送任务列表）
    kReceiveTasksChanged, // 接收列表变化（完整的接收任务列表）
    kHistoryChanged,      // 传输历史变化（按完成时间倒序的历史记录）
    kOperationFailed,     // 前端发起的操作执行失败（操作名和失败原因）
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kSendTasksChanged, "SendTasksChanged"},
                                 {FeedbackType::kReceiveTasksChanged, "ReceiveTasksChanged"},
                                 {FeedbackType::kHistoryChanged, "HistoryChanged"},
                                 {FeedbackType::kOperationFailed, "OperationFailed"},
                             });

} // namespace puresend::core
