#pragma once

#include "task_item.h"
#include "task_status.h"
#include <core/util/time.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace puresend::core {

enum class RelayChannel {
    kUpload,   // remote party pushes files to this device
    kDownload, // remote party fetches files this device shares
};

NLOHMANN_JSON_SERIALIZE_ENUM(RelayChannel,
                             {
                                 {RelayChannel::kUpload, "upload"},
                                 {RelayChannel::kDownload, "download"},
                             })

inline TaskOrigin OriginOf(RelayChannel channel) {
    return channel == RelayChannel::kUpload ? TaskOrigin::kRelayUpload
                                            : TaskOrigin::kRelayDownload;
}

// One file moving through a relay request
struct TransferRecord {
    std::string id;
    std::string file_name;
    std::uint64_t bytes_transferred{0};
    std::uint64_t total_bytes{0};
    int progress{0};
    std::uint64_t speed{0};
    TaskStatus status{TaskStatus::kTransferring};
    Millis started_at{0};
    std::optional<Millis> completed_at;
};

struct AccessRequest {
    std::string id;
    RelayChannel channel{RelayChannel::kUpload};
    std::string address;     // requester IP
    std::string label;       // 展示名称，例如 "Chrome(Android)"
    std::string client_id;   // raw User-Agent
    ApprovalStatus status{ApprovalStatus::kPending};
    std::vector<TransferRecord> records;
    Millis requested_at{0};
    std::optional<Millis> expires_at;

    std::uint64_t sequence{0};
};

// pending -> accepted | rejected | expired, accepted -> expired. Re-applying the current
// status is allowed and changes nothing.
inline bool CanTransition(ApprovalStatus from, ApprovalStatus to) {
    if (from == to) {
        return true;
    }
    switch (from) {
    case ApprovalStatus::kPending:
        return true;
    case ApprovalStatus::kAccepted:
        return to == ApprovalStatus::kExpired;
    case ApprovalStatus::kRejected:
    case ApprovalStatus::kExpired:
        return false;
    }
    return false;
}

// Short label such as "Firefox(Linux)" from a User-Agent string; the address when the
// client identifier is empty or unrecognised.
std::string DeriveClientLabel(std::string_view client_id, std::string_view address);

void to_json(nlohmann::json& j, const TransferRecord& record);
void from_json(const nlohmann::json& j, TransferRecord& record);
void to_json(nlohmann::json& j, const AccessRequest& request);
void from_json(const nlohmann::json& j, AccessRequest& request);

} // namespace puresend::core
