#pragma once

#include "ipc_event_stream.h"
#include "model.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/constant/path.h>
#include <core/engine/transfer_engine.h>
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

/**
 * @brief IPC后端服务类
 *
 * @details 从IpcEventStream轮询前端发来的操作，交给TransferEngine执行，并把引擎产生的
 * 反馈（任务列表、历史记录变化，操作失败）写回IpcEventStream。
 *
 * 传输层抛出的TransportError在这里被捕获，转换为OperationFailed反馈。
 * ModifySettings修改后的设置会写回config_file。
 *
 * @note 此类不可复制或赋值。
 */
namespace puresend::ipc {

class IpcBackendService {
public:
    IpcBackendService(boost::asio::io_context& ioc,
                      IpcEventStream& event_stream,
                      core::TransferEngine& engine,
                      std::filesystem::path config_file = core::path::kConfigFile);
    ~IpcBackendService() = default;
    IpcBackendService(const IpcBackendService&) = delete;
    IpcBackendService& operator=(const IpcBackendService&) = delete;

    void Start();
    void Stop();

    void SetExitAppCallback(std::function<void()>&& callback);

    // Called after a ModifySettings operation changed the engine settings
    void SetSettingsChangedCallback(std::function<void()>&& callback);

private:
    boost::asio::io_context& ioc_;
    IpcEventStream& event_stream_;
    core::TransferEngine& engine_;
    std::filesystem::path config_file_;
    std::function<void()> exit_app_callback_ = nullptr;
    std::function<void()> settings_changed_callback_ = nullptr;
    bool is_running_{false};

    // 协程任务，轮询操作
    boost::asio::awaitable<void> start();

    // 分发处理轮询到的前端用户操作
    void dispatchOperation(const Operation& operation);

    // 同意/拒绝/取消/移除/恢复任务
    void acceptTask(const operation::TaskTarget& target);
    void rejectTask(const operation::TaskTarget& target);
    void cancelTask(const operation::TaskTarget& target);
    void removeTask(const operation::TaskTarget& target);
    void resumeTask(const operation::TaskTarget& target);

    void cleanupTasks();

    // 修改设置
    void modifySettings(std::string_view key, const nlohmann::json& value);

    // 退出
    void shutdown();

    void operationFailed(std::string_view operation, std::string_view message);
};

} // namespace puresend::ipc
