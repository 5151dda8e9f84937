#include <algorithm>
#include <core/task/event_reconciler.h>
#include <core/util/time.h>
#include <spdlog/spdlog.h>
#include <variant>

namespace puresend::core {

namespace {

template<typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool isFinished(TaskStatus status) {
    return status == TaskStatus::kCompleted || status == TaskStatus::kFailed
           || status == TaskStatus::kCancelled;
}

// A cached record location is only trusted when the event comes from the same request
bool belongsTo(const UnifiedTaskItem& item, const RelayFileEvent& event) {
    if (item.origin() != OriginOf(event.channel)) {
        return false;
    }
    if (event.channel == RelayChannel::kUpload && !event.request_id.empty()) {
        return item.source_id() == event.request_id;
    }
    return event.client_address.empty() || item.counterpart_address == event.client_address;
}

} // namespace

EventReconciler::EventReconciler(TaskStore& store,
                                 TaskItemBoard& board,
                                 ApprovalWorkflow& approval,
                                 std::size_t cache_capacity)
    : store_(store)
    , board_(board)
    , approval_(approval)
    , record_cache_(cache_capacity) {}

void EventReconciler::SetFileFinishedCallback(FileFinishedCallback callback) {
    file_finished_callback_ = std::move(callback);
}

void EventReconciler::Handle(const TransportEvent& event) {
    std::visit(Overloaded{
                   [this](const DirectEvent& e) { handleDirect(e); },
                   [this](const RelayRequestEvent& e) { handleRequest(e); },
                   [this](const RelayFileEvent& e) { handleFile(e); },
               },
               event);
}

void EventReconciler::ForgetItem(const TaskItemId& id) {
    auto erased = record_cache_.EraseItem(id);
    if (erased > 0) {
        spdlog::debug("EventReconciler: evicted {} record(s) of {}", erased, id.ToString());
    }
}

void EventReconciler::handleDirect(const DirectEvent& event) {
    switch (event.kind) {
    case DirectEvent::Kind::kProgress:
        store_.ApplyProgress(event.task_id, event.bytes_transferred, event.speed);
        break;
    case DirectEvent::Kind::kError:
        store_.ApplyTerminal(event.task_id, TaskStatus::kFailed, event.message);
        break;
    case DirectEvent::Kind::kComplete:
        store_.ApplyTerminal(event.task_id, TaskStatus::kCompleted);
        break;
    case DirectEvent::Kind::kInterrupted:
        store_.ApplyInterrupted(event.task_id, event.bytes_transferred, event.message);
        break;
    }
}

void EventReconciler::handleRequest(const RelayRequestEvent& event) {
    switch (event.kind) {
    case RelayRequestEvent::Kind::kCreated: {
        auto request = event.request;
        request.channel = event.channel;
        approval_.OnRequestCreated(request);
        break;
    }
    case RelayRequestEvent::Kind::kStatusChanged: {
        auto request = event.request;
        request.channel = event.channel;
        approval_.OnRequestStatusChanged(request);
        break;
    }
    case RelayRequestEvent::Kind::kRemoved:
        approval_.OnRequestRemoved(event.channel,
                                   event.request_id.empty() ? event.request.id : event.request_id);
        break;
    }
}

void EventReconciler::handleFile(const RelayFileEvent& event) {
    if (event.kind == RelayFileEvent::Kind::kStarted) {
        fileStarted(event);
    } else {
        fileUpdated(event);
    }
}

UnifiedTaskItem* EventReconciler::resolveItem(const RelayFileEvent& event, bool create) {
    if (event.channel == RelayChannel::kUpload && !event.request_id.empty()) {
        TaskItemId id{TaskOrigin::kRelayUpload, event.request_id};
        if (auto* item = board_.Find(id); item) {
            return item;
        }
        if (!create) {
            return nullptr;
        }
        if (auto request = store_.GetRequest(event.request_id); request) {
            return &approval_.SyncItem(*request);
        }
        // 未收到请求事件（例如免确认上传），直接按已同意创建
        auto& item = board_.Ensure(id,
                                   DeriveClientLabel({}, event.client_address),
                                   event.client_address,
                                   NowMillis());
        item.approval_status = ApprovalStatus::kAccepted;
        return &item;
    }

    auto origin = OriginOf(event.channel);
    if (auto request = store_.FindLatestRequest(event.channel, event.client_address); request) {
        if (auto* item = board_.Find(TaskItemId{origin, request->id}); item) {
            return item;
        }
        return &approval_.SyncItem(*request);
    }
    return board_.FindLatestByAddress(origin, event.client_address);
}

void EventReconciler::fileStarted(const RelayFileEvent& event) {
    if (auto location = record_cache_.Get(event.record_id); location) {
        if (const auto* cached = board_.Find(location->item); cached && belongsTo(*cached, event)) {
            spdlog::debug("EventReconciler: record {} already started, treated as progress",
                          event.record_id);
            fileUpdated(event);
            return;
        }
    }

    auto* item = resolveItem(event, true);
    if (!item) {
        spdlog::warn("EventReconciler: no request matches {} from {}, file \"{}\" dropped",
                     event.channel == RelayChannel::kUpload ? "upload" : "download",
                     event.client_address,
                     event.file_name);
        return;
    }
    if (item->transfer_status == TaskStatus::kCancelled) {
        spdlog::debug("EventReconciler: {} is cancelled, file \"{}\" dropped",
                      item->id.ToString(),
                      event.file_name);
        return;
    }

    auto now = NowMillis();
    TaskFileEntry entry;
    entry.name = event.file_name;
    entry.size = event.total_bytes;
    entry.bytes_transferred = std::min(event.bytes_transferred, event.total_bytes);
    entry.progress = ProgressPercent(entry.bytes_transferred, entry.size);
    entry.speed = event.speed;
    entry.status = TaskStatus::kTransferring;
    entry.started_at = now;
    if (!event.record_id.empty()) {
        entry.record_id = event.record_id;
    }
    item->files.push_back(std::move(entry));
    auto index = item->files.size() - 1;
    if (!event.record_id.empty()) {
        record_cache_.Put(event.record_id, FileLocation{item->id, index});
    }
    item->RecomputeAggregate(now);
    recordOnRequest(*item, item->files[index]);
}

std::optional<std::size_t> EventReconciler::locateFile(UnifiedTaskItem& item,
                                                       const RelayFileEvent& event) {
    auto& files = item.files;
    auto by_name = [&](bool transferring_only) -> std::optional<std::size_t> {
        for (auto i = files.size(); i > 0; --i) {
            const auto& file = files[i - 1];
            if (file.name != event.file_name) {
                continue;
            }
            if (transferring_only && file.status != TaskStatus::kTransferring) {
                continue;
            }
            return i - 1;
        }
        return std::nullopt;
    };

    auto index = by_name(true);
    if (!index) {
        index = by_name(false);
    }
    if (index && !event.record_id.empty()) {
        record_cache_.Put(event.record_id, FileLocation{item.id, *index});
    }
    return index;
}

void EventReconciler::fileUpdated(const RelayFileEvent& event) {
    UnifiedTaskItem* item = nullptr;
    std::optional<std::size_t> index;

    if (auto location = record_cache_.Get(event.record_id); location) {
        item = board_.Find(location->item);
        if (item && belongsTo(*item, event) && location->index < item->files.size()
            && (event.file_name.empty() || item->files[location->index].name == event.file_name)) {
            index = location->index;
        }
    }
    if (!index) {
        item = resolveItem(event, false);
        if (item) {
            index = locateFile(*item, event);
        }
    }
    if (!item || !index) {
        spdlog::debug("EventReconciler: record {} (\"{}\") matches no file, event dropped",
                      event.record_id,
                      event.file_name);
        return;
    }
    if (item->transfer_status == TaskStatus::kCancelled) {
        spdlog::debug("EventReconciler: {} is cancelled, update dropped", item->id.ToString());
        return;
    }

    auto& file = item->files[*index];
    if (isFinished(file.status)) {
        spdlog::debug("EventReconciler: file \"{}\" of {} already {}, update dropped",
                      file.name,
                      item->id.ToString(),
                      TaskStatusToString(file.status));
        return;
    }
    if (file.size == 0) {
        file.size = event.total_bytes;
    }

    auto now = NowMillis();
    if (event.kind != RelayFileEvent::Kind::kCompleted) {
        auto bytes = file.size > 0 ? std::min(event.bytes_transferred, file.size)
                                   : event.bytes_transferred;
        file.bytes_transferred = std::max(file.bytes_transferred, bytes);
        file.progress = ProgressPercent(file.bytes_transferred, file.size);
        file.speed = event.speed;
        file.status = TaskStatus::kTransferring;
        item->RecomputeAggregate(now);
        recordOnRequest(*item, file);
        return;
    }

    if (event.succeeded) {
        file.status = TaskStatus::kCompleted;
        file.bytes_transferred = file.size;
        file.progress = 100;
    } else {
        file.status = TaskStatus::kFailed;
    }
    file.speed = 0;
    item->RecomputeAggregate(now);
    recordOnRequest(*item, file);
    spdlog::info("{} file \"{}\" {}",
                 item->id.ToString(),
                 file.name,
                 event.succeeded ? "completed" : "failed");

    if (file_finished_callback_) {
        file_finished_callback_(*item, *index);
    }
}

void EventReconciler::recordOnRequest(const UnifiedTaskItem& item, const TaskFileEntry& file) {
    if (!file.record_id) {
        return;
    }
    TransferRecord record{
        .id = *file.record_id,
        .file_name = file.name,
        .bytes_transferred = file.bytes_transferred,
        .total_bytes = file.size,
        .progress = file.progress,
        .speed = file.speed,
        .status = file.status,
        .started_at = file.started_at.value_or(0),
    };
    if (isFinished(file.status)) {
        record.completed_at = NowMillis();
    }
    store_.UpsertRequestRecord(item.source_id(), record);
}

} // namespace puresend::core
