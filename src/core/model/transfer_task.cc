#include <core/model/transfer_task.h>

using json = nlohmann::json;

namespace puresend::core {

void to_json(json& j, const FileDescriptor& file) {
    j = json{{"name", file.name}, {"size", file.size}};
    if (file.hash) {
        j["hash"] = *file.hash;
    }
}

void from_json(const json& j, FileDescriptor& file) {
    j.at("name").get_to(file.name);
    file.size = j.value("size", std::uint64_t{0});
    if (j.contains("hash") && j["hash"].is_string()) {
        file.hash = j["hash"].get<std::string>();
    } else {
        file.hash = std::nullopt;
    }
}

void to_json(json& j, const PeerDescriptor& peer) {
    j = json{{"id", peer.id}, {"address", peer.address}, {"port", peer.port}, {"name", peer.name}};
}

void from_json(const json& j, PeerDescriptor& peer) {
    peer.id = j.value("id", std::string{});
    peer.address = j.value("address", std::string{});
    peer.port = j.value("port", std::uint16_t{0});
    peer.name = j.value("name", std::string{});
}

void to_json(json& j, const TransferTask& task) {
    j = json{
        {"id", task.id},
        {"file", task.file},
        {"direction", task.direction},
        {"mode", task.mode},
        {"peer", task.peer},
        {"status", task.status},
        {"progress", task.progress},
        {"bytesTransferred", task.bytes_transferred},
        {"speed", task.speed},
        {"resumable", task.resumable},
        {"resumeOffset", task.resume_offset},
        {"resumed", task.resumed},
        {"createdAt", task.created_at},
    };
    if (task.completed_at) {
        j["completedAt"] = *task.completed_at;
    }
    if (task.error) {
        j["error"] = *task.error;
    }
}

} // namespace puresend::core
