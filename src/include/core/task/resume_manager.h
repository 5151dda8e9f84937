#pragma once

#include <core/task/task_store.h>
#include <core/transport/transport.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace puresend::core {

// Resumption of interrupted direct transfers. Checkpoints themselves live in the transport.
class ResumeManager {
public:
    ResumeManager(TaskStore& store, Transport& transport);
    ResumeManager(const ResumeManager&) = delete;
    ResumeManager& operator=(const ResumeManager&) = delete;

    // Empty when the transport cannot be queried
    std::vector<ResumableTransfer> ListResumable();

    // interrupted -> transferring, then asks the transport to continue. A transport
    // failure turns the task into failed; it is not retried.
    bool Resume(const std::string& task_id);

    // One checkpoint, or with no id every checkpoint whose task is no longer tracked.
    // Returns the number of checkpoints discarded.
    std::size_t Cleanup(const std::optional<std::string>& task_id = std::nullopt);

private:
    TaskStore& store_;
    Transport& transport_;
};

} // namespace puresend::core
