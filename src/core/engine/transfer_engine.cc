#include <boost/asio/post.hpp>
#include <core/engine/transfer_engine.h>
#include <core/util/time.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace puresend::core {

namespace {

RelayChannel channelOf(TaskOrigin origin) {
    return origin == TaskOrigin::kRelayUpload ? RelayChannel::kUpload : RelayChannel::kDownload;
}

TransferDirection sideOf(RelayChannel channel) {
    return channel == RelayChannel::kUpload ? TransferDirection::kReceive
                                            : TransferDirection::kSend;
}

} // namespace

TransferEngine::TransferEngine(net::io_context& ioc,
                               Transport& transport,
                               Settings& settings,
                               std::filesystem::path history_file)
    : ioc_(ioc)
    , transport_(transport)
    , settings_(settings)
    , approval_(store_, board_, transport)
    , reconciler_(store_, board_, approval_, settings.record_cache_capacity)
    , resume_manager_(store_, transport)
    , ledger_(std::move(history_file), settings.max_history_count) {
    store_.SetCompletedCallback([this](const TransferTask& task) { recordTask(task); });
    reconciler_.SetFileFinishedCallback(
        [this](const UnifiedTaskItem& item, std::size_t index) { recordRelayFile(item, index); });
}

void TransferEngine::SetFeedbackCallback(FeedbackCallback callback) {
    callback_ = std::move(callback);
}

std::string TransferEngine::Submit(const FileDescriptor& file, const PeerDescriptor& peer) {
    auto task_id = transport_.SubmitDirectTransfer(file, peer);
    store_.CreateTask(TaskDescriptor{
        .id = task_id,
        .file = file,
        .direction = TransferDirection::kSend,
        .peer = peer,
    });
    spdlog::info("Sending \"{}\" to {} ({})", file.name, peer.name, task_id);
    notifyTasksChanged(TransferDirection::kSend);
    return task_id;
}

std::string TransferEngine::TrackIncoming(const TaskDescriptor& descriptor) {
    auto task_id = store_.CreateTask(descriptor);
    notifyTasksChanged(descriptor.direction);
    return task_id;
}

bool TransferEngine::Cancel(const std::string& task_id) {
    auto task = store_.Get(task_id);
    if (!task) {
        spdlog::warn("Cannot cancel task {}: unknown task", task_id);
        return false;
    }
    bool was_interrupted = task->status == TaskStatus::kInterrupted;
    if (!store_.ApplyTerminal(task_id, TaskStatus::kCancelled)) {
        return false;
    }

    net::post(ioc_, [this, task_id, was_interrupted]() {
        try {
            transport_.CancelDirectTransfer(task_id);
            if (was_interrupted) {
                transport_.CleanupResumeState(task_id);
            }
        } catch (const TransportError& e) {
            spdlog::error("Transport failed to cancel task {}: {}", task_id, e.what());
        }
    });
    notifyTasksChanged(task->direction);
    return true;
}

bool TransferEngine::RemoveTask(const TaskItemId& id) {
    if (id.origin == TaskOrigin::kDirect) {
        auto task = store_.Get(id.inner);
        if (!task) {
            return false;
        }
        if (!IsTerminal(task->status)) {
            Cancel(id.inner);
        }
        store_.Remove(id.inner);
        notifyTasksChanged(task->direction);
        return true;
    }

    if (!board_.Contains(id)) {
        return false;
    }
    auto channel = channelOf(id.origin);
    if (store_.GetRequest(id.inner)) {
        try {
            approval_.Remove(channel, id.inner);
        } catch (const TransportError&) {
            // 传输层失败时仍然从本地视图中移除
            store_.RemoveRequest(id.inner);
        }
    }
    board_.Remove(id);
    reconciler_.ForgetItem(id);
    notifyTasksChanged(sideOf(channel));
    return true;
}

std::size_t TransferEngine::CleanupFinished() {
    std::size_t removed = store_.RemoveFinished().size();
    for (auto origin : {TaskOrigin::kRelayUpload, TaskOrigin::kRelayDownload}) {
        for (const auto& id : board_.RemoveFinished(origin)) {
            reconciler_.ForgetItem(id);
            ++removed;
        }
    }
    if (removed > 0) {
        spdlog::info("Removed {} finished task(s)", removed);
        notifyTasksChanged(TransferDirection::kSend);
        notifyTasksChanged(TransferDirection::kReceive);
    }
    return removed;
}

void TransferEngine::HandleEvent(const TransportEvent& event) {
    reconciler_.Handle(event);

    if (const auto* direct = std::get_if<DirectEvent>(&event); direct) {
        if (auto task = store_.Get(direct->task_id); task) {
            notifyTasksChanged(task->direction);
        }
    } else if (const auto* request = std::get_if<RelayRequestEvent>(&event); request) {
        notifyTasksChanged(sideOf(request->channel));
    } else if (const auto* file = std::get_if<RelayFileEvent>(&event); file) {
        notifyTasksChanged(sideOf(file->channel));
    }
}

bool TransferEngine::AcceptRequest(const TaskItemId& id) {
    if (id.origin == TaskOrigin::kDirect) {
        spdlog::warn("Task {} has no approval step", id.ToString());
        return false;
    }
    auto channel = channelOf(id.origin);
    if (!approval_.Accept(channel, id.inner)) {
        return false;
    }
    notifyTasksChanged(sideOf(channel));
    return true;
}

bool TransferEngine::RejectRequest(const TaskItemId& id) {
    if (id.origin == TaskOrigin::kDirect) {
        spdlog::warn("Task {} has no approval step", id.ToString());
        return false;
    }
    auto channel = channelOf(id.origin);
    if (!approval_.Reject(channel, id.inner)) {
        return false;
    }
    notifyTasksChanged(sideOf(channel));
    return true;
}

void TransferEngine::ClearRequests(RelayChannel channel) {
    approval_.Clear(channel);
    notifyTasksChanged(sideOf(channel));
}

RelayServerInfo TransferEngine::StartRelayUploadServer() {
    auto info = transport_.StartRelayUploadServer(settings_.receive_dir,
                                                  settings_.auto_accept,
                                                  settings_.file_overwrite);
    spdlog::info("Relay upload server listening on port {}", info.port);
    return info;
}

void TransferEngine::StopRelayUploadServer() {
    transport_.StopRelayUploadServer();
    spdlog::info("Relay upload server stopped");
}

RelayServerInfo TransferEngine::StartRelayDownloadServer(
    const std::vector<std::filesystem::path>& files, const RelayShareSettings& share_settings) {
    auto info = transport_.StartRelayDownloadServer(files, share_settings);
    spdlog::info("Sharing {} file(s) on port {}", files.size(), info.port);
    return info;
}

void TransferEngine::StopRelayDownloadServer() {
    transport_.StopRelayDownloadServer();
    spdlog::info("Relay download server stopped");
}

std::vector<UnifiedTaskItem> TransferEngine::SendTasks() const {
    return ProjectSendTasks(store_, board_);
}

std::vector<UnifiedTaskItem> TransferEngine::PendingSendTasks() const {
    return PendingOnly(ProjectSendTasks(store_, board_));
}

std::vector<UnifiedTaskItem> TransferEngine::ReceiveTasks() const {
    return ProjectReceiveTasks(store_, board_);
}

std::vector<UnifiedTaskItem> TransferEngine::PendingReceiveTasks() const {
    return PendingOnly(ProjectReceiveTasks(store_, board_));
}

std::vector<ResumableTransfer> TransferEngine::ListResumable() {
    return resume_manager_.ListResumable();
}

bool TransferEngine::Resume(const std::string& task_id) {
    auto task = store_.Get(task_id);
    auto resumed = resume_manager_.Resume(task_id);
    if (task) {
        notifyTasksChanged(task->direction);
    }
    return resumed;
}

std::size_t TransferEngine::CleanupResumeState(const std::optional<std::string>& task_id) {
    return resume_manager_.Cleanup(task_id);
}

bool TransferEngine::LoadHistory() {
    ledger_.SetMaxCount(settings_.max_history_count);
    auto loaded = ledger_.Load();
    ApplyHistoryRetention();
    if (ledger_.dirty()) {
        scheduleHistorySave();
    }
    notifyHistoryChanged();
    return loaded;
}

std::vector<HistoryItem> TransferEngine::History(const HistoryFilter& filter,
                                                 const HistorySort& sort) const {
    return ledger_.List(filter, sort);
}

std::size_t TransferEngine::RemoveHistory(const std::vector<std::string>& ids) {
    auto removed = ledger_.RemoveMany(ids);
    if (removed > 0) {
        scheduleHistorySave();
        notifyHistoryChanged();
    }
    return removed;
}

void TransferEngine::ClearHistory() {
    ledger_.Clear();
    scheduleHistorySave();
    notifyHistoryChanged();
}

std::size_t TransferEngine::ApplyHistoryRetention() {
    RetentionPolicy policy;
    switch (settings_.cleanup_strategy) {
    case CleanupStrategy::kDisabled:
        policy = RetentionPolicy::Disabled();
        break;
    case CleanupStrategy::kByTime:
        policy = RetentionPolicy::ByTime(settings_.retention_days);
        break;
    case CleanupStrategy::kByCount:
        policy = RetentionPolicy::ByCount(settings_.max_count);
        break;
    }
    auto removed = ledger_.ApplyRetention(policy, NowMillis());
    if (removed > 0) {
        scheduleHistorySave();
        notifyHistoryChanged();
    }
    return removed;
}

void TransferEngine::ReloadSettings() {
    ledger_.SetMaxCount(settings_.max_history_count);
    if (ledger_.dirty()) {
        scheduleHistorySave();
        notifyHistoryChanged();
    }
}

void TransferEngine::recordTask(const TransferTask& task) {
    recordHistory(HistoryItem{
        .id = task.id,
        .file_name = task.file.name,
        .file_size = task.file.size,
        .peer_name = task.peer.name.empty() ? task.peer.address : task.peer.name,
        .peer_address = settings_.hide_peer_address ? std::nullopt
                                                    : std::optional<std::string>(task.peer.address),
        .status = task.status,
        .direction = task.direction,
        .completed_at = task.completed_at.value_or(NowMillis()),
        .mode = task.mode,
        .error = task.error,
    });
}

void TransferEngine::recordRelayFile(const UnifiedTaskItem& item, std::size_t file_index) {
    auto make = [&](const TaskFileEntry& file, std::size_t index, Millis completed_at) {
        return HistoryItem{
            .id = fmt::format("{}-{}", item.id.ToString(), file.record_id.value_or(std::to_string(index))),
            .file_name = file.name,
            .file_size = file.size,
            .peer_name = item.counterpart_label,
            .peer_address = settings_.hide_peer_address
                                ? std::nullopt
                                : std::optional<std::string>(item.counterpart_address),
            .status = file.status,
            .direction = item.origin() == TaskOrigin::kRelayUpload ? TransferDirection::kReceive
                                                                   : TransferDirection::kSend,
            .completed_at = completed_at,
            .mode = TransferMode::kRelay,
        };
    };

    if (item.origin() == TaskOrigin::kRelayDownload) {
        recordHistory(make(item.files[file_index], file_index, NowMillis()));
        return;
    }

    // 上传请求等全部文件结束后一次性写入
    if (item.transfer_status != TaskStatus::kCompleted
        && item.transfer_status != TaskStatus::kFailed) {
        return;
    }
    auto completed_at = item.completed_at.value_or(NowMillis());
    for (std::size_t i = 0; i < item.files.size(); ++i) {
        recordHistory(make(item.files[i], i, completed_at));
    }
}

void TransferEngine::recordHistory(HistoryItem item) {
    if (!settings_.record_history) {
        return;
    }
    if (ledger_.Append(std::move(item))) {
        scheduleHistorySave();
        notifyHistoryChanged();
    }
}

void TransferEngine::scheduleHistorySave() {
    if (save_pending_) {
        return;
    }
    save_pending_ = true;
    net::post(ioc_, [this]() {
        save_pending_ = false;
        if (!ledger_.Save()) {
            spdlog::warn("History kept in memory, the next change will retry the save");
        }
    });
}

void TransferEngine::notifyTasksChanged(TransferDirection side) {
    if (!callback_) {
        return;
    }
    if (side == TransferDirection::kSend) {
        feedback(Feedback{.type = FeedbackType::kSendTasksChanged, .data = SendTasks()});
    } else {
        feedback(Feedback{.type = FeedbackType::kReceiveTasksChanged, .data = ReceiveTasks()});
    }
}

void TransferEngine::notifyHistoryChanged() {
    if (!callback_) {
        return;
    }
    feedback(Feedback{.type = FeedbackType::kHistoryChanged, .data = ledger_.List()});
}

void TransferEngine::feedback(Feedback&& feedback) {
    if (callback_) {
        callback_(std::move(feedback));
    }
}

} // namespace puresend::core
