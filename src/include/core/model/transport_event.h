#pragma once

#include "access_request.h"
#include "task_status.h"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace puresend::core {

// Direct channel: the transport reports by task id
struct DirectEvent {
    enum class Kind {
        kProgress,
        kError,
        kComplete,
        kInterrupted,
    };

    Kind kind{Kind::kProgress};
    std::string task_id;
    std::uint64_t bytes_transferred{0}; // progress, interrupted
    std::uint64_t speed{0};             // progress
    std::string message;                // error, interrupted
};

// Relay request lifecycle. `request` is filled for created/status-changed,
// `request_id` for removed.
struct RelayRequestEvent {
    enum class Kind {
        kCreated,
        kStatusChanged,
        kRemoved,
    };

    Kind kind{Kind::kCreated};
    RelayChannel channel{RelayChannel::kUpload};
    AccessRequest request;
    std::string request_id;
};

// Relay per-file transfer. Upload events carry request_id; download events carry only
// the requester address and are resolved to the newest request from that address.
struct RelayFileEvent {
    enum class Kind {
        kStarted,
        kProgress,
        kCompleted,
    };

    Kind kind{Kind::kStarted};
    RelayChannel channel{RelayChannel::kUpload};
    std::string request_id;
    std::string client_address;
    std::string record_id;
    std::string file_name;
    std::uint64_t bytes_transferred{0};
    std::uint64_t total_bytes{0};
    std::uint64_t speed{0};
    bool succeeded{true}; // completed only
};

using TransportEvent = std::variant<DirectEvent, RelayRequestEvent, RelayFileEvent>;

} // namespace puresend::core
