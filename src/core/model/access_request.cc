#include <algorithm>
#include <cctype>
#include <core/model/access_request.h>
#include <fmt/format.h>

using json = nlohmann::json;

namespace puresend::core {

namespace {

std::string toLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::string_view detectPlatform(const std::string& ua) {
    if (ua.find("android") != std::string::npos) {
        return "Android";
    }
    // iOS user agents also mention "Mac OS X", so check them first
    if (ua.find("iphone") != std::string::npos || ua.find("ipad") != std::string::npos
        || ua.find("ipod") != std::string::npos) {
        return "iOS";
    }
    if (ua.find("mac") != std::string::npos) {
        return "macOS";
    }
    if (ua.find("windows") != std::string::npos) {
        return "Windows";
    }
    if (ua.find("linux") != std::string::npos) {
        return "Linux";
    }
    return {};
}

std::string_view detectBrowser(const std::string& ua) {
    if (ua.find("edg/") != std::string::npos || ua.find("edge") != std::string::npos) {
        return "Edge";
    }
    if (ua.find("opr/") != std::string::npos || ua.find("opera") != std::string::npos) {
        return "Opera";
    }
    if (ua.find("firefox") != std::string::npos || ua.find("fxios") != std::string::npos) {
        return "Firefox";
    }
    if (ua.find("chrome") != std::string::npos || ua.find("crios") != std::string::npos) {
        return "Chrome";
    }
    if (ua.find("safari") != std::string::npos) {
        return "Safari";
    }
    if (ua.find("msie") != std::string::npos || ua.find("trident") != std::string::npos) {
        return "IE";
    }
    return {};
}

} // namespace

std::string DeriveClientLabel(std::string_view client_id, std::string_view address) {
    auto ua = toLower(client_id);
    auto platform = detectPlatform(ua);
    auto browser = detectBrowser(ua);

    if (browser.empty() && platform.empty()) {
        return address.empty() ? std::string("Browser") : std::string(address);
    }
    if (platform.empty()) {
        return std::string(browser);
    }
    return fmt::format("{}({})", browser.empty() ? std::string_view("Browser") : browser, platform);
}

void to_json(json& j, const TransferRecord& record) {
    j = json{
        {"id", record.id},
        {"fileName", record.file_name},
        {"transferredBytes", record.bytes_transferred},
        {"totalBytes", record.total_bytes},
        {"progress", record.progress},
        {"speed", record.speed},
        {"status", record.status},
        {"startedAt", record.started_at},
    };
    if (record.completed_at) {
        j["completedAt"] = *record.completed_at;
    }
}

void from_json(const json& j, TransferRecord& record) {
    j.at("id").get_to(record.id);
    record.file_name = j.value("fileName", std::string{});
    record.bytes_transferred = j.value("transferredBytes", std::uint64_t{0});
    record.total_bytes = j.value("totalBytes", std::uint64_t{0});
    record.progress = j.value("progress", 0);
    record.speed = j.value("speed", std::uint64_t{0});
    record.status = j.value("status", TaskStatus::kTransferring);
    record.started_at = j.value("startedAt", Millis{0});
    if (j.contains("completedAt") && j["completedAt"].is_number()) {
        record.completed_at = j["completedAt"].get<Millis>();
    }
}

void to_json(json& j, const AccessRequest& request) {
    j = json{
        {"id", request.id},
        {"channel", request.channel},
        {"address", request.address},
        {"label", request.label},
        {"clientId", request.client_id},
        {"status", request.status},
        {"records", request.records},
        {"requestedAt", request.requested_at},
    };
    if (request.expires_at) {
        j["expiresAt"] = *request.expires_at;
    }
}

void from_json(const json& j, AccessRequest& request) {
    j.at("id").get_to(request.id);
    request.channel = j.value("channel", RelayChannel::kUpload);
    request.address = j.value("address", std::string{});
    request.client_id = j.value("clientId", std::string{});
    request.label = j.value("label", std::string{});
    if (request.label.empty()) {
        request.label = DeriveClientLabel(request.client_id, request.address);
    }
    request.status = j.value("status", ApprovalStatus::kPending);
    request.records = j.value("records", std::vector<TransferRecord>{});
    request.requested_at = j.value("requestedAt", Millis{0});
    if (j.contains("expiresAt") && j["expiresAt"].is_number()) {
        request.expires_at = j["expiresAt"].get<Millis>();
    }
}

} // namespace puresend::core
