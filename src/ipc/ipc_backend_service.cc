#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <core/model/feedback.h>
#include <core/util/config.h>
#include <ipc/ipc_backend_service.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace net = boost::asio;

namespace puresend::ipc {

namespace {

std::optional<core::TaskItemId> parseTarget(const operation::TaskTarget& target) {
    auto side = target.side == "send" ? core::TransferDirection::kSend
                                      : core::TransferDirection::kReceive;
    return core::TaskItemId::Parse(target.task_id, side);
}

} // namespace

IpcBackendService::IpcBackendService(boost::asio::io_context& ioc,
                                     IpcEventStream& event_stream,
                                     core::TransferEngine& engine,
                                     std::filesystem::path config_file)
    : ioc_(ioc)
    , event_stream_(event_stream)
    , engine_(engine)
    , config_file_(std::move(config_file))
    , is_running_(true) {
    engine_.SetFeedbackCallback(
        [this](core::Feedback&& feedback) { event_stream_.PostFeedback(std::move(feedback)); });
}

void IpcBackendService::Start() {
    net::co_spawn(ioc_, start(), net::detached);
    spdlog::debug("IpcBackendService started");
}

void IpcBackendService::Stop() {
    is_running_ = false;
    spdlog::debug("IpcBackendService stopped");
}

void IpcBackendService::SetExitAppCallback(std::function<void()>&& callback) {
    exit_app_callback_ = std::move(callback);
}

void IpcBackendService::SetSettingsChangedCallback(std::function<void()>&& callback) {
    settings_changed_callback_ = std::move(callback);
}

net::awaitable<void> IpcBackendService::start() {
    auto executor = co_await net::this_coro::executor;
    while (is_running_) {
        if (auto operation = event_stream_.PollOperation(); operation) {
            try {
                dispatchOperation(*operation);
            } catch (const core::TransportError& e) {
                operationFailed(nlohmann::json(operation->type).get<std::string>(), e.what());
            }
        } else {
            co_await net::post(executor, net::use_awaitable);
        }
    }
}

void IpcBackendService::dispatchOperation(const Operation& operation) {
    switch (operation.type) {
    case OperationType::kAcceptTask: {
        spdlog::debug("IpcBackendService: dispatch operation \"AcceptTask\"");
        if (auto data = operation.getData<operation::TaskTarget>(); data) {
            acceptTask(*data);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"AcceptTask\"");
        }
        break;
    }
    case OperationType::kRejectTask: {
        spdlog::debug("IpcBackendService: dispatch operation \"RejectTask\"");
        if (auto data = operation.getData<operation::TaskTarget>(); data) {
            rejectTask(*data);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"RejectTask\"");
        }
        break;
    }
    case OperationType::kCancelTask: {
        spdlog::debug("IpcBackendService: dispatch operation \"CancelTask\"");
        if (auto data = operation.getData<operation::TaskTarget>(); data) {
            cancelTask(*data);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"CancelTask\"");
        }
        break;
    }
    case OperationType::kRemoveTask: {
        spdlog::debug("IpcBackendService: dispatch operation \"RemoveTask\"");
        if (auto data = operation.getData<operation::TaskTarget>(); data) {
            removeTask(*data);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"RemoveTask\"");
        }
        break;
    }
    case OperationType::kResumeTask: {
        spdlog::debug("IpcBackendService: dispatch operation \"ResumeTask\"");
        if (auto data = operation.getData<operation::TaskTarget>(); data) {
            resumeTask(*data);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"ResumeTask\"");
        }
        break;
    }
    case OperationType::kCleanupTasks: {
        spdlog::debug("IpcBackendService: dispatch operation \"CleanupTasks\"");
        cleanupTasks();
        break;
    }
    case OperationType::kRemoveHistory: {
        spdlog::debug("IpcBackendService: dispatch operation \"RemoveHistory\"");
        if (auto data = operation.getData<operation::RemoveHistory>(); data) {
            engine_.RemoveHistory(data->ids);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"RemoveHistory\"");
        }
        break;
    }
    case OperationType::kClearHistory: {
        spdlog::debug("IpcBackendService: dispatch operation \"ClearHistory\"");
        engine_.ClearHistory();
        break;
    }
    case OperationType::kModifySettings: {
        spdlog::debug("IpcBackendService: dispatch operation \"ModifySettings\"");
        if (auto data = operation.getData<operation::ModifySettings>(); data) {
            modifySettings(data->key, data->value);
        } else {
            spdlog::error("IPC Error: Invalid data for operation \"ModifySettings\"");
        }
        break;
    }
    case OperationType::kShutdown: {
        shutdown();
        break;
    }
    }
}

void IpcBackendService::acceptTask(const operation::TaskTarget& target) {
    auto id = parseTarget(target);
    if (!id || !engine_.AcceptRequest(*id)) {
        operationFailed("AcceptTask", fmt::format("Cannot accept task {}", target.task_id));
    }
}

void IpcBackendService::rejectTask(const operation::TaskTarget& target) {
    auto id = parseTarget(target);
    if (!id || !engine_.RejectRequest(*id)) {
        operationFailed("RejectTask", fmt::format("Cannot reject task {}", target.task_id));
    }
}

void IpcBackendService::cancelTask(const operation::TaskTarget& target) {
    auto id = parseTarget(target);
    if (!id) {
        operationFailed("CancelTask", fmt::format("Invalid task id {}", target.task_id));
        return;
    }
    bool cancelled = false;
    if (id->origin == core::TaskOrigin::kDirect) {
        cancelled = engine_.Cancel(id->inner);
    } else {
        // 中继任务只能在等待确认时取消，即拒绝请求
        cancelled = engine_.RejectRequest(*id);
    }
    if (!cancelled) {
        operationFailed("CancelTask", fmt::format("Cannot cancel task {}", target.task_id));
    }
}

void IpcBackendService::removeTask(const operation::TaskTarget& target) {
    auto id = parseTarget(target);
    if (!id || !engine_.RemoveTask(*id)) {
        operationFailed("RemoveTask", fmt::format("Cannot remove task {}", target.task_id));
    }
}

void IpcBackendService::resumeTask(const operation::TaskTarget& target) {
    auto id = parseTarget(target);
    if (!id || id->origin != core::TaskOrigin::kDirect || !engine_.Resume(id->inner)) {
        operationFailed("ResumeTask", fmt::format("Cannot resume task {}", target.task_id));
    }
}

void IpcBackendService::cleanupTasks() {
    engine_.CleanupFinished();
    engine_.CleanupResumeState();
}

void IpcBackendService::modifySettings(std::string_view key, const nlohmann::json& value) {
    auto& settings = engine_.settings();
    try {
        if (key == "receive-dir") {
            settings.receive_dir = value.get<std::string>();
        } else if (key == "auto-accept") {
            settings.auto_accept = value.get<bool>();
        } else if (key == "file-overwrite") {
            auto policy = core::OverwritePolicyFromString(value.get<std::string>());
            if (!policy) {
                operationFailed("ModifySettings", "Invalid value for file-overwrite");
                return;
            }
            settings.file_overwrite = *policy;
        } else if (key == "record-history") {
            settings.record_history = value.get<bool>();
        } else if (key == "hide-peer-address") {
            settings.hide_peer_address = value.get<bool>();
        } else if (key == "cleanup-strategy") {
            auto strategy = core::CleanupStrategyFromString(value.get<std::string>());
            if (!strategy) {
                operationFailed("ModifySettings", "Invalid value for cleanup-strategy");
                return;
            }
            settings.cleanup_strategy = *strategy;
        } else if (key == "retention-days") {
            settings.retention_days = value.get<std::uint32_t>();
        } else if (key == "max-count") {
            settings.max_count = value.get<std::size_t>();
        } else if (key == "max-history-count") {
            settings.max_history_count = value.get<std::size_t>();
        } else {
            spdlog::error("IPC Error: Invalid key for ModifySettings");
            operationFailed("ModifySettings", fmt::format("Unknown setting {}", key));
            return;
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("IPC Error: Failed to modify settings: {}", e.what());
        operationFailed("ModifySettings", e.what());
        return;
    }

    engine_.ReloadSettings();
    if (&core::settings != &settings) {
        core::settings = settings;
    }
    if (!core::SaveConfig(config_file_)) {
        operationFailed("ModifySettings", "Failed to save settings");
    }
    if (key == "cleanup-strategy" || key == "retention-days" || key == "max-count") {
        engine_.ApplyHistoryRetention();
    }
    if (settings_changed_callback_) {
        settings_changed_callback_();
    }
}

void IpcBackendService::shutdown() {
    Stop();
    ioc_.stop();
    if (exit_app_callback_) {
        exit_app_callback_();
    }
}

void IpcBackendService::operationFailed(std::string_view operation, std::string_view message) {
    spdlog::warn("Operation {} failed: {}", operation, message);
    event_stream_.PostFeedback(core::Feedback{
        .type = core::FeedbackType::kOperationFailed,
        .data = core::feedback::OperationFailed{.operation = std::string(operation),
                                                .message = std::string(message)},
    });
}

} // namespace puresend::ipc
