#pragma once

#include <nlohmann/json.hpp>

namespace puresend::ipc {

enum class OperationType {
    kAcceptTask,    // 同意中继请求，提供任务id和所在列表（send/receive）
    kRejectTask,    // 拒绝中继请求，提供任务id和所在列表
    kCancelTask,    // 取消点对点传输，提供任务id和所在列表
    kRemoveTask,    // 从列表中移除任务，进行中的任务会先取消
    kResumeTask,    // 从断点恢复中断的传输，提供任务id
    kCleanupTasks,  // 清理已完成/已取消的任务和失效的断点，不用提供数据
    kRemoveHistory, // 删除若干条传输历史，提供历史id数组
    kClearHistory,  // 清空传输历史，不用提供数据
    kModifySettings, // 修改设置
    kShutdown,       // 要求后端退出
};

NLOHMANN_JSON_SERIALIZE_ENUM(OperationType,
                             {
                                 {OperationType::kAcceptTask, "AcceptTask"},
                                 {OperationType::kRejectTask, "RejectTask"},
                                 {OperationType::kCancelTask, "CancelTask"},
                                 {OperationType::kRemoveTask, "RemoveTask"},
                                 {OperationType::kResumeTask, "ResumeTask"},
                                 {OperationType::kCleanupTasks, "CleanupTasks"},
                                 {OperationType::kRemoveHistory, "RemoveHistory"},
                                 {OperationType::kClearHistory, "ClearHistory"},
                                 {OperationType::kModifySettings, "ModifySettings"},
                                 {OperationType::kShutdown, "Shutdown"},
                             });

} // namespace puresend::ipc
