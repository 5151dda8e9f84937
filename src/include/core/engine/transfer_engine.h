#pragma once

#include <boost/asio/io_context.hpp>
#include <core/constant/path.h>
#include <core/history/history_ledger.h>
#include <core/model/feedback.h>
#include <core/model/transport_event.h>
#include <core/task/approval_workflow.h>
#include <core/task/event_reconciler.h>
#include <core/task/resume_manager.h>
#include <core/task/task_item_board.h>
#include <core/task/task_store.h>
#include <core/task/view_projector.h>
#include <core/transport/transport.h>
#include <core/util/config.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace puresend::core {

/**
 * @brief Entry point of the transfer core
 *
 * @details Owns the task store, the relay item board, the reconciler, the approval and
 * resume logic and the history ledger, and wires them together. Every call, including
 * HandleEvent, must run on the io_context passed in. History saves and transport
 * cancellations are posted to that io_context after the in-memory change, so readers
 * always see the latest state even while a save is pending.
 *
 * Calls that go to the transport synchronously (Submit, AcceptRequest, RejectRequest,
 * the relay server functions) let TransportError through.
 */
class TransferEngine {
public:
    TransferEngine(boost::asio::io_context& ioc,
                   Transport& transport,
                   Settings& settings,
                   std::filesystem::path history_file = path::kHistoryFile);
    ~TransferEngine() = default;
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void SetFeedbackCallback(FeedbackCallback callback);

    // Direct transfers

    std::string Submit(const FileDescriptor& file, const PeerDescriptor& peer);

    // Starts tracking a transfer announced by a peer
    std::string TrackIncoming(const TaskDescriptor& descriptor);

    bool Cancel(const std::string& task_id);

    // Removes a task or relay item from view, stopping it first when still active
    bool RemoveTask(const TaskItemId& id);

    // Drops completed and cancelled tasks and items, returns how many went away
    std::size_t CleanupFinished();

    void HandleEvent(const TransportEvent& event);

    // Relay requests

    bool AcceptRequest(const TaskItemId& id);
    bool RejectRequest(const TaskItemId& id);
    void ClearRequests(RelayChannel channel);

    RelayServerInfo StartRelayUploadServer();
    void StopRelayUploadServer();
    RelayServerInfo StartRelayDownloadServer(const std::vector<std::filesystem::path>& files,
                                             const RelayShareSettings& share_settings);
    void StopRelayDownloadServer();

    // Views

    std::vector<UnifiedTaskItem> SendTasks() const;
    std::vector<UnifiedTaskItem> PendingSendTasks() const;
    std::vector<UnifiedTaskItem> ReceiveTasks() const;
    std::vector<UnifiedTaskItem> PendingReceiveTasks() const;

    // Resume

    std::vector<ResumableTransfer> ListResumable();
    bool Resume(const std::string& task_id);
    std::size_t CleanupResumeState(const std::optional<std::string>& task_id = std::nullopt);

    // History

    // Loads the ledger and applies the configured cleanup strategy
    bool LoadHistory();
    std::vector<HistoryItem> History(const HistoryFilter& filter = {},
                                     const HistorySort& sort = {}) const;
    std::size_t RemoveHistory(const std::vector<std::string>& ids);
    void ClearHistory();
    std::size_t ApplyHistoryRetention();

    // Re-reads the settings that take effect at runtime
    void ReloadSettings();

    Settings& settings() { return settings_; }
    const TaskStore& store() const { return store_; }
    const TaskItemBoard& board() const { return board_; }
    const HistoryLedger& ledger() const { return ledger_; }
    const EventReconciler& reconciler() const { return reconciler_; }

private:
    void recordTask(const TransferTask& task);
    void recordRelayFile(const UnifiedTaskItem& item, std::size_t file_index);
    void recordHistory(HistoryItem item);

    void scheduleHistorySave();
    void notifyTasksChanged(TransferDirection side);
    void notifyHistoryChanged();
    void feedback(Feedback&& feedback);

    boost::asio::io_context& ioc_;
    Transport& transport_;
    Settings& settings_;

    TaskStore store_;
    TaskItemBoard board_;
    ApprovalWorkflow approval_;
    EventReconciler reconciler_;
    ResumeManager resume_manager_;
    HistoryLedger ledger_;

    FeedbackCallback callback_;
    bool save_pending_{false};
};

} // namespace puresend::core
