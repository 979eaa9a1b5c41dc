#include "upl/pipeline/finalizer.hpp"

#include "upl/core/hash.hpp"
#include "upl/events/events.hpp"
#include "upl/session/event_log.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace upl::pipeline {
namespace fs = std::filesystem;

using model::SessionStatus;

namespace {

const std::unordered_map<std::string, std::string>& content_types() {
    static const std::unordered_map<std::string, std::string> table = {
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"aiff", "audio/aiff"},
        {"aif", "audio/aiff"},
        {"flac", "audio/flac"},
        {"m4a", "audio/mp4"},
        {"ogg", "audio/ogg"},
        {"mp4", "video/mp4"},
        {"m4v", "video/mp4"},
        {"mov", "video/quicktime"},
        {"avi", "video/x-msvideo"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"txt", "text/plain"},
    };
    return table;
}

bool is_stage_key(const std::string& key) {
    return key == session::keys::kAssembly || key == session::keys::kVirusScan ||
           key == session::keys::kFinalization || key == session::keys::kCancellation ||
           key == session::keys::kCleanup || key == session::keys::kFailure ||
           key == session::keys::kScreening;
}

} // namespace

Finalizer::Finalizer(storage::SessionRepository& repository,
                     storage::DurableStorage& storage,
                     events::EventBus& bus,
                     core::Clock clock)
    : repository_(repository), storage_(storage), bus_(bus), clock_(std::move(clock)) {}

std::string Finalizer::content_type_for(const std::string& filename) {
    auto extension = fs::path(filename).extension().string();
    if (extension.size() < 2) {
        return kDefaultContentType;
    }
    extension.erase(0, 1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = content_types();
    const auto it = table.find(extension);
    return it == table.end() ? kDefaultContentType : it->second;
}

nlohmann::json Finalizer::asset_metadata(const model::UploadSession& session, const nlohmann::json& folded) const {
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [key, value] : folded.items()) {
        if (!is_stage_key(key)) {
            metadata[key] = value;
        }
    }

    metadata["upload_session_id"] = session.id;
    metadata["chunks_count"] = session.chunks_count;
    const auto scanned_at = session.scan_completed_at.value_or(clock_());
    metadata["upload_duration"] = core::seconds_between(session.created_at, scanned_at);
    if (folded.contains(session::keys::kVirusScan)) {
        metadata["virus_scan"] = folded.at(session::keys::kVirusScan);
    }
    return metadata;
}

upl::Result<model::Asset> Finalizer::record_finalization(const model::UploadSession& session,
                                                         const model::Asset& asset) {
    const auto now = clock_();
    auto recorded = repository_.append_event(session.id,
        session::make_event("finalized", session::keys::kFinalization, {
            {"asset_id", asset.id},
            {"asset_filename", asset.filename},
            {"finalized_at", core::to_iso8601(now)},
            {"file_size", asset.file_size},
        }, now),
        {SessionStatus::Completed});
    if (recorded.is_error()) {
        return upl::Err<model::Asset>(recorded.error());
    }
    return upl::Ok(asset);
}

upl::Result<model::Asset> Finalizer::finalize(const std::string& session_id) {
    auto loaded = repository_.get_session(session_id);
    if (loaded.is_error()) {
        return upl::Err<model::Asset>(loaded.error());
    }
    const auto session = loaded.value();
    if (session.status != SessionStatus::Completed) {
        if (session.status == SessionStatus::Cancelled) {
            return upl::Err<model::Asset>(ErrorKind::Cancelled, "Session " + session_id + " was cancelled");
        }
        return upl::Err<model::Asset>(ErrorKind::InvalidTransition,
            "Session " + session_id + " is " + model::to_string(session.status) + ", not completed");
    }

    auto history = repository_.events(session_id);
    if (history.is_error()) {
        return upl::Err<model::Asset>(history.error());
    }
    const auto folded = session::fold_metadata(history.value());

    if (auto asset_id = session::finalized_asset_id(folded)) {
        spdlog::debug("[Finalizer] session={} already finalized as {}", session_id, *asset_id);
        return repository_.get_asset(*asset_id);
    }

    const auto scan = session::scan_status(folded);
    if (scan != "clean" && scan != "skipped") {
        return upl::Err<model::Asset>(ErrorKind::InvalidTransition,
            "Session " + session_id + " has no clean scan verdict (" + (scan.empty() ? "none" : scan) + ")");
    }

    auto existing = repository_.find_asset_by_session(session_id);
    if (existing.is_error()) {
        return upl::Err<model::Asset>(existing.error());
    }
    if (existing.value()) {
        spdlog::info("[Finalizer] session={} asset {} existed, recording it", session_id, existing.value()->id);
        return record_finalization(session, *existing.value());
    }

    std::error_code ec;
    const fs::path source = session.assembled_file_path;
    if (source.empty() || !fs::is_regular_file(source, ec)) {
        const upl::Error missing{ErrorKind::FileNotFound, "Assembled file not found: " + source.string()};
        spdlog::error("[Finalizer] session={} {}", session_id, missing.message);
        if (auto failed = fail(session_id, missing); failed.is_error()) {
            return upl::Err<model::Asset>(failed.error());
        }
        return upl::Err<model::Asset>(missing);
    }

    const auto content_type = content_type_for(session.filename);
    auto attached = storage_.attach(source, "session_" + session_id, session.filename, content_type);
    if (attached.is_error()) {
        return upl::Err<model::Asset>(attached.error());
    }

    model::Asset asset;
    asset.id = core::generate_id("ast");
    asset.session_id = session.id;
    asset.workspace_id = session.workspace_id;
    asset.container_id = session.container_id;
    asset.user_id = session.user_id;
    asset.filename = session.filename;
    asset.file_size = attached.value().size;
    asset.content_type = content_type;
    asset.metadata = asset_metadata(session, folded);
    asset.storage = attached.value();
    asset.created_at = clock_();

    auto inserted = repository_.insert_asset_once(asset);
    if (inserted.is_error()) {
        return upl::Err<model::Asset>(inserted.error());
    }
    const bool created = inserted.value().id == asset.id;

    auto recorded = record_finalization(session, inserted.value());
    if (recorded.is_error()) {
        return recorded;
    }

    fs::remove(source, ec);
    if (ec) {
        spdlog::warn("[Finalizer] session={} temp file {} not removed: {}", session_id, source.string(), ec.message());
    }

    if (created) {
        bus_.emit(events::AssetFinalizedEvent{session_id, asset.id, asset.filename, asset.content_type,
                                              asset.file_size});
    }
    return recorded;
}

upl::Result<model::UploadSession> Finalizer::fail(const std::string& session_id, const upl::Error& error) {
    const auto now = clock_();
    storage::TransitionRequest request;
    request.expected_from = {SessionStatus::Completed};
    request.to = SessionStatus::FinalizationFailed;
    request.error_message = "Finalization failed: " + error.message;
    request.at = now;
    request.events.push_back(session::make_event("finalization_failed", session::keys::kFinalization, {
        {"error", error.message},
        {"error_kind", upl::to_string(error.kind)},
        {"failed_at", core::to_iso8601(now)},
    }, now));

    auto committed = repository_.apply_transition(session_id, request);
    if (committed.is_ok()) {
        bus_.emit(events::SessionFailedEvent{session_id, SessionStatus::FinalizationFailed, *request.error_message});
    }
    return committed;
}

} // namespace upl::pipeline
