#include "upl/model/types.hpp"

#include <array>
#include <utility>

namespace upl::model {
namespace {

constexpr std::array<std::pair<SessionStatus, const char*>, 9> kSessionStatusNames{{
    {SessionStatus::Pending, "pending"},
    {SessionStatus::Uploading, "uploading"},
    {SessionStatus::Assembling, "assembling"},
    {SessionStatus::VirusScanning, "virus_scanning"},
    {SessionStatus::Completed, "completed"},
    {SessionStatus::Failed, "failed"},
    {SessionStatus::FinalizationFailed, "finalization_failed"},
    {SessionStatus::VirusScanFailed, "virus_scan_failed"},
    {SessionStatus::Cancelled, "cancelled"},
}};

constexpr std::array<std::pair<ChunkStatus, const char*>, 3> kChunkStatusNames{{
    {ChunkStatus::Pending, "pending"},
    {ChunkStatus::Completed, "completed"},
    {ChunkStatus::Failed, "failed"},
}};

nlohmann::json optional_string(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json optional_time(const std::optional<core::TimePoint>& value) {
    return value ? nlohmann::json(core::to_iso8601(*value)) : nlohmann::json(nullptr);
}

} // namespace

const char* to_string(SessionStatus status) {
    for (const auto& [value, name] : kSessionStatusNames) {
        if (value == status) {
            return name;
        }
    }
    return "unknown";
}

std::optional<SessionStatus> parse_session_status(std::string_view text) {
    for (const auto& [value, name] : kSessionStatusNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

const char* to_string(ChunkStatus status) {
    for (const auto& [value, name] : kChunkStatusNames) {
        if (value == status) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ChunkStatus> parse_chunk_status(std::string_view text) {
    for (const auto& [value, name] : kChunkStatusNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

nlohmann::json to_json(const UploadSession& session) {
    return {
        {"id", session.id},
        {"workspace_id", session.workspace_id},
        {"container_id", optional_string(session.container_id)},
        {"user_id", session.user_id},
        {"filename", session.filename},
        {"total_size", session.total_size},
        {"chunks_count", session.chunks_count},
        {"status", to_string(session.status)},
        {"assembled_file_path", session.assembled_file_path},
        {"error_message", session.error_message},
        {"created_at", core::to_iso8601(session.created_at)},
        {"updated_at", core::to_iso8601(session.updated_at)},
        {"scan_queued_at", optional_time(session.scan_queued_at)},
        {"scan_completed_at", optional_time(session.scan_completed_at)},
    };
}

nlohmann::json to_json(const Chunk& chunk) {
    return {
        {"session_id", chunk.session_id},
        {"chunk_number", chunk.chunk_number},
        {"size", chunk.size},
        {"checksum", chunk.checksum},
        {"status", to_string(chunk.status)},
        {"storage_key", chunk.storage_key},
        {"error", chunk.error},
    };
}

nlohmann::json to_json(const StorageReference& reference) {
    return {
        {"backend", reference.backend},
        {"key", reference.key},
        {"filename", reference.filename},
        {"content_type", reference.content_type},
        {"size", reference.size},
    };
}

nlohmann::json to_json(const Asset& asset) {
    return {
        {"id", asset.id},
        {"session_id", asset.session_id},
        {"workspace_id", asset.workspace_id},
        {"container_id", optional_string(asset.container_id)},
        {"user_id", asset.user_id},
        {"filename", asset.filename},
        {"file_size", asset.file_size},
        {"content_type", asset.content_type},
        {"metadata", asset.metadata},
        {"storage", to_json(asset.storage)},
        {"created_at", core::to_iso8601(asset.created_at)},
    };
}

} // namespace upl::model
