#pragma once

#include <core/model/access_request.h>
#include <core/model/transfer_task.h>
#include <core/util/config.h>
#include <core/util/time.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace puresend::core {

// Thrown by a Transport when an operation cannot be carried out
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ResumableTransfer {
    std::string task_id;
    FileDescriptor file;
    std::uint64_t resume_offset{0};
    Millis interrupted_at{0};
    Millis expires_at{0};
};

struct RelayServerInfo {
    std::uint16_t port{0};
    std::vector<std::string> urls;
};

struct RelayShareSettings {
    bool pin_enabled{false};
    std::string pin;
    bool auto_accept{false};
};

/**
 * @brief Network side of a transfer
 *
 * @details Implemented outside the core (sockets, HTTP servers, encryption). Calls made
 * through this interface may throw TransportError. Progress comes back as
 * TransportEvent values handed to TransferEngine::HandleEvent on the engine's
 * io_context.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::string SubmitDirectTransfer(const FileDescriptor& file,
                                             const PeerDescriptor& peer)
        = 0;
    virtual void CancelDirectTransfer(const std::string& task_id) = 0;
    virtual void ResumeDirectTransfer(const std::string& task_id) = 0;
    virtual std::vector<ResumableTransfer> ListResumableDirectTransfers() = 0;
    // nullopt discards every checkpoint
    virtual void CleanupResumeState(const std::optional<std::string>& task_id) = 0;

    virtual RelayServerInfo StartRelayUploadServer(const std::filesystem::path& directory,
                                                   bool auto_accept,
                                                   OverwritePolicy overwrite_policy)
        = 0;
    virtual void StopRelayUploadServer() = 0;
    virtual RelayServerInfo StartRelayDownloadServer(
        const std::vector<std::filesystem::path>& files, const RelayShareSettings& settings)
        = 0;
    virtual void StopRelayDownloadServer() = 0;

    virtual void AcceptRequest(RelayChannel channel, const std::string& request_id) = 0;
    virtual void RejectRequest(RelayChannel channel, const std::string& request_id) = 0;
    virtual void RemoveRequest(RelayChannel channel, const std::string& request_id) = 0;
    virtual void ClearRequests(RelayChannel channel) = 0;
};

} // namespace puresend::core
