#include "upl/pipeline/upload_service.hpp"

#include "upl/core/hash.hpp"
#include "upl/events/events.hpp"
#include "upl/session/event_log.hpp"
#include "upl/session/state_machine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <optional>

namespace upl::pipeline {
namespace fs = std::filesystem;

using model::SessionStatus;

namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024;
constexpr std::uint64_t kGiB = 1024ULL * kMiB;

const std::vector<SessionStatus> kOpenForChunks = {SessionStatus::Pending, SessionStatus::Uploading};

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_reserved_device_name(const std::string& filename) {
    const auto stem = to_lower(filename.substr(0, filename.find('.')));
    if (stem == "con" || stem == "prn" || stem == "aux" || stem == "nul") {
        return true;
    }
    if (stem.size() == 4 && (stem.compare(0, 3, "com") == 0 || stem.compare(0, 3, "lpt") == 0)) {
        return stem[3] >= '1' && stem[3] <= '9';
    }
    return false;
}

/// Extensions refused whatever the content.
const std::vector<std::string> kBlockedExtensions = {"scr", "pif", "com"};

std::string last_extension(const std::string& filename) {
    const auto dot = filename.rfind('.');
    return dot == std::string::npos ? std::string() : to_lower(filename.substr(dot + 1));
}

bool looks_like_extension(const std::string& part) {
    return part.size() >= 2 && part.size() <= 4 &&
           std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isalnum(c); });
}

/// Sessions past assembly no longer carry chunk records.
bool past_assembly(const model::UploadSession& session) {
    switch (session.status) {
        case SessionStatus::VirusScanning:
        case SessionStatus::Completed:
        case SessionStatus::VirusScanFailed:
        case SessionStatus::FinalizationFailed:
            return true;
        default:
            return !session.assembled_file_path.empty();
    }
}

} // namespace

nlohmann::json to_json(const SessionStatusView& view) {
    nlohmann::json j = model::to_json(view.session);
    j["completed_chunks"] = view.completed_chunks;
    j["missing_chunks"] = view.missing_chunks;
    j["progress"] = view.progress;
    j["uploaded_bytes"] = view.uploaded_bytes;
    j["remaining_bytes"] = view.remaining_bytes;
    j["recommended_chunk_size"] = view.recommended_chunk_size;
    j["metadata"] = view.metadata;
    if (view.asset_id) {
        j["asset_id"] = *view.asset_id;
    }
    return j;
}

UploadService::UploadService(core::PipelineConfig config,
                             storage::SessionRepository& repository,
                             storage::ChunkStore& chunks,
                             Assembler& assembler,
                             ScannerGateway& gateway,
                             Finalizer& finalizer,
                             JobRunner& runner,
                             events::EventBus& bus,
                             core::Clock clock)
    : config_(std::move(config)),
      repository_(repository),
      chunks_(chunks),
      assembler_(assembler),
      gateway_(gateway),
      finalizer_(finalizer),
      runner_(runner),
      bus_(bus),
      clock_(std::move(clock)) {}

std::uint64_t UploadService::recommended_chunk_size(std::uint64_t total_size) {
    if (total_size <= 10 * kMiB) {
        return kMiB;
    }
    if (total_size < kGiB) {
        return 5 * kMiB;
    }
    if (total_size <= 5 * kGiB) {
        return 10 * kMiB;
    }
    return 25 * kMiB;
}

upl::Result<void> UploadService::validate_filename(const std::string& filename, std::size_t max_length) {
    if (filename.empty()) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "Filename is required");
    }
    if (filename.size() > max_length) {
        return upl::Err<void>(ErrorKind::InvalidArgument,
                              "Filename exceeds " + std::to_string(max_length) + " characters");
    }
    const bool blank = std::all_of(filename.begin(), filename.end(),
                                   [](unsigned char c) { return std::isspace(c); });
    const bool dots = filename.find_first_not_of('.') == std::string::npos;
    if (blank || dots) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "Filename '" + filename + "' is not a file name");
    }
    if (filename.find("..") != std::string::npos) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "Filename may not contain '..'");
    }
    if (filename.find_first_of("<>:\"|*?/\\") != std::string::npos) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "Filename contains a forbidden character");
    }
    if (is_reserved_device_name(filename)) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "Filename '" + filename + "' is a reserved name");
    }
    const auto extension = last_extension(filename);
    if (std::find(kBlockedExtensions.begin(), kBlockedExtensions.end(), extension) != kBlockedExtensions.end()) {
        return upl::Err<void>(ErrorKind::InvalidArgument,
                              "File type '." + extension + "' is not allowed for security reasons");
    }
    return upl::Ok();
}

bool UploadService::has_multiple_extensions(const std::string& filename) {
    const auto last = filename.rfind('.');
    if (last == std::string::npos || last == 0) {
        return false;
    }
    const auto previous = filename.rfind('.', last - 1);
    if (previous == std::string::npos) {
        return false;
    }
    return looks_like_extension(filename.substr(last + 1)) &&
           looks_like_extension(filename.substr(previous + 1, last - previous - 1));
}

upl::Result<void> UploadService::validate(const CreateSessionRequest& request) const {
    if (request.workspace_id.empty()) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "workspace_id is required");
    }
    if (request.user_id.empty()) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "user_id is required");
    }
    if (auto valid = validate_filename(request.filename, config_.limits.max_filename_length); valid.is_error()) {
        return valid;
    }
    if (request.total_size == 0) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "total_size must be greater than 0");
    }
    if (request.total_size > config_.limits.max_file_size) {
        return upl::Err<void>(ErrorKind::InvalidArgument,
                              "total_size exceeds the limit of " + std::to_string(config_.limits.max_file_size));
    }
    if (request.chunks_count == 0) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "chunks_count must be greater than 0");
    }
    if (request.chunks_count > request.total_size) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "chunks_count exceeds total_size");
    }
    if (!request.metadata.is_null() && !request.metadata.is_object()) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "metadata must be an object");
    }
    return upl::Ok();
}

upl::Result<model::UploadSession> UploadService::create_session(const CreateSessionRequest& request) {
    if (auto valid = validate(request); valid.is_error()) {
        return upl::Err<model::UploadSession>(valid.error());
    }

    const auto now = clock_();
    model::UploadSession session;
    session.id = core::generate_id("ses");
    session.workspace_id = request.workspace_id;
    session.container_id = request.container_id;
    session.user_id = request.user_id;
    session.filename = request.filename;
    session.total_size = request.total_size;
    session.chunks_count = request.chunks_count;
    session.status = SessionStatus::Pending;
    session.created_at = now;
    session.updated_at = now;

    const auto client = request.metadata.is_null() ? nlohmann::json::object() : request.metadata;
    std::vector<session::SessionEvent> initial;
    initial.push_back(session::make_event("session_created", session::keys::kRoot, client, now));
    if (has_multiple_extensions(request.filename)) {
        spdlog::warn("[UploadService] {} carries more than one extension", request.filename);
        initial.push_back(session::make_event("filename_flagged", session::keys::kScreening, {
            {"risk_level", "high"},
            {"warnings", nlohmann::json::array({"Multiple file extensions detected"})},
        }, now));
    }

    auto created = repository_.create_session(session, std::move(initial));
    if (created.is_error()) {
        spdlog::info("[UploadService] create rejected for {}: {}", request.filename, created.error().message);
        return created;
    }

    spdlog::info("[UploadService] session={} created for {} ({} bytes, {} chunks)",
                 session.id, session.filename, session.total_size, session.chunks_count);
    bus_.emit(events::SessionCreatedEvent{session.id, session.workspace_id, session.filename,
                                          session.total_size, session.chunks_count});
    return created;
}

void UploadService::mark_uploading(const model::UploadSession& session) {
    if (session.status != SessionStatus::Pending) {
        return;
    }
    storage::TransitionRequest request;
    request.expected_from = {SessionStatus::Pending};
    request.to = SessionStatus::Uploading;
    request.at = clock_();
    auto moved = repository_.apply_transition(session.id, request);
    if (moved.is_error() && moved.error().kind != ErrorKind::InvalidTransition) {
        spdlog::warn("[UploadService] session={} not marked uploading: {}", session.id, moved.error().message);
    }
}

upl::Result<model::Chunk> UploadService::record_failed_chunk(model::Chunk chunk, const upl::Error& cause) {
    chunk.status = model::ChunkStatus::Failed;
    chunk.storage_key.clear();
    chunk.error = cause.message;
    if (auto recorded = repository_.upsert_chunk(chunk, kOpenForChunks); recorded.is_error()) {
        spdlog::warn("[UploadService] session={} failed chunk {} not recorded: {}",
                     chunk.session_id, chunk.chunk_number, recorded.error().message);
    }
    return upl::Err<model::Chunk>(ErrorKind::Storage,
        "Failed to store chunk " + std::to_string(chunk.chunk_number) + ": " + cause.message);
}

upl::Result<model::Chunk> UploadService::upload_chunk(const ChunkUpload& upload) {
    auto loaded = repository_.get_session(upload.session_id);
    if (loaded.is_error()) {
        return upl::Err<model::Chunk>(loaded.error());
    }
    const auto session = loaded.value();

    if (!session::accepts_chunks(session.status)) {
        return upl::Err<model::Chunk>(ErrorKind::InvalidTransition,
            "Session " + session.id + " is " + model::to_string(session.status) + " and accepts no chunks");
    }
    if (upload.chunk_number < 1 || upload.chunk_number > session.chunks_count) {
        return upl::Err<model::Chunk>(ErrorKind::InvalidArgument,
            "Chunk number " + std::to_string(upload.chunk_number) + " outside 1.." +
            std::to_string(session.chunks_count));
    }
    if (upload.data.empty()) {
        return upl::Err<model::Chunk>(ErrorKind::InvalidArgument, "Chunk payload is empty");
    }

    const auto checksum = core::fnv1a_hex(upload.data);
    if (upload.checksum && to_lower(*upload.checksum) != checksum) {
        return upl::Err<model::Chunk>(ErrorKind::InvalidArgument,
            "Checksum mismatch for chunk " + std::to_string(upload.chunk_number));
    }

    model::Chunk chunk;
    chunk.session_id = session.id;
    chunk.chunk_number = upload.chunk_number;
    chunk.size = upload.data.size();
    chunk.checksum = checksum;
    chunk.updated_at = clock_();

    auto staged = chunks_.stage(session.id, upload.chunk_number, upload.data);
    if (staged.is_error()) {
        return record_failed_chunk(chunk, staged.error());
    }

    // The bytes replace the chunk key only if the record is accepted, under
    // the same gate that moves the session on to assembling.
    chunk.status = model::ChunkStatus::Completed;
    chunk.storage_key = staged.value().chunk_key;
    std::optional<upl::Error> commit_error;
    auto recorded = repository_.upsert_chunk(chunk, kOpenForChunks, [&]() -> upl::Result<void> {
        auto committed = chunks_.commit(staged.value());
        if (committed.is_error()) {
            commit_error = committed.error();
        }
        return committed;
    });
    if (recorded.is_error()) {
        if (auto dropped = chunks_.discard(staged.value()); dropped.is_error()) {
            spdlog::warn("[UploadService] staged chunk {} not removed: {}", staged.value().staged_key,
                         dropped.error().message);
        }
        if (commit_error) {
            return record_failed_chunk(chunk, *commit_error);
        }
        return upl::Err<model::Chunk>(recorded.error());
    }

    mark_uploading(session);
    bus_.emit(events::ChunkStoredEvent{session.id, chunk.chunk_number, session.chunks_count, chunk.size});

    if (config_.auto_assemble) {
        auto listed = repository_.list_chunks(session.id);
        if (listed.is_ok() && Assembler::chunks_complete(session.chunks_count, listed.value())) {
            auto begun = begin_assembly(session.id, session.chunks_count);
            if (begun.is_ok() && begun.value()) {
                dispatch_assembly(session.id);
            }
        }
    }
    return upl::Ok(std::move(chunk));
}

upl::Result<bool> UploadService::begin_assembly(const std::string& session_id, std::uint32_t chunks_received) {
    const auto now = clock_();
    storage::TransitionRequest request;
    request.expected_from = {SessionStatus::Pending, SessionStatus::Uploading};
    request.to = SessionStatus::Assembling;
    request.at = now;
    request.events.push_back(session::make_event("upload_completed", session::keys::kAssembly, {
        {"status", "queued"},
        {"chunks_received", chunks_received},
        {"queued_at", core::to_iso8601(now)},
    }, now));

    auto moved = repository_.apply_transition(session_id, request);
    if (moved.is_error()) {
        if (moved.error().kind == ErrorKind::InvalidTransition) {
            return upl::Ok(false);
        }
        return upl::Err<bool>(moved.error());
    }
    spdlog::info("[UploadService] session={} all {} chunks received, assembling", session_id, chunks_received);
    return upl::Ok(true);
}

upl::Result<model::UploadSession> UploadService::complete_upload(const std::string& session_id) {
    auto loaded = repository_.get_session(session_id);
    if (loaded.is_error()) {
        return loaded;
    }
    const auto& session = loaded.value();

    switch (session.status) {
        case SessionStatus::Assembling:
        case SessionStatus::VirusScanning:
        case SessionStatus::Completed:
            return loaded;
        case SessionStatus::Pending:
        case SessionStatus::Uploading:
            break;
        default:
            return upl::Err<model::UploadSession>(ErrorKind::InvalidTransition,
                "Session " + session_id + " is " + model::to_string(session.status));
    }

    auto listed = repository_.list_chunks(session_id);
    if (listed.is_error()) {
        return upl::Err<model::UploadSession>(listed.error());
    }
    if (!Assembler::chunks_complete(session.chunks_count, listed.value())) {
        const auto missing = Assembler::missing_chunks(session.chunks_count, listed.value());
        return upl::Err<model::UploadSession>(ErrorKind::InvalidArgument,
            "Upload incomplete: " + std::to_string(missing.size()) + " of " +
            std::to_string(session.chunks_count) + " chunks missing");
    }

    auto begun = begin_assembly(session_id, session.chunks_count);
    if (begun.is_error()) {
        return upl::Err<model::UploadSession>(begun.error());
    }
    if (begun.value()) {
        dispatch_assembly(session_id);
    }
    return repository_.get_session(session_id);
}

upl::Result<SessionStatusView> UploadService::status(const std::string& session_id) const {
    auto loaded = repository_.get_session(session_id);
    if (loaded.is_error()) {
        return upl::Err<SessionStatusView>(loaded.error());
    }
    auto history = repository_.events(session_id);
    if (history.is_error()) {
        return upl::Err<SessionStatusView>(history.error());
    }

    SessionStatusView view;
    view.session = loaded.value();
    view.metadata = session::fold_metadata(history.value());
    view.asset_id = session::finalized_asset_id(view.metadata);
    view.recommended_chunk_size = recommended_chunk_size(view.session.total_size);

    if (past_assembly(view.session)) {
        view.completed_chunks = view.session.chunks_count;
        view.uploaded_bytes = view.session.total_size;
    } else {
        auto listed = repository_.list_chunks(session_id);
        if (listed.is_error()) {
            return upl::Err<SessionStatusView>(listed.error());
        }
        view.missing_chunks = Assembler::missing_chunks(view.session.chunks_count, listed.value());
        view.completed_chunks = view.session.chunks_count - static_cast<std::uint32_t>(view.missing_chunks.size());
        for (const auto& chunk : listed.value()) {
            if (chunk.status == model::ChunkStatus::Completed) {
                view.uploaded_bytes += chunk.size;
            }
        }
    }

    view.remaining_bytes = view.uploaded_bytes >= view.session.total_size
        ? 0 : view.session.total_size - view.uploaded_bytes;
    const double ratio = view.session.chunks_count == 0
        ? 0.0 : static_cast<double>(view.completed_chunks) / view.session.chunks_count;
    view.progress = std::round(ratio * 10000.0) / 100.0;
    return upl::Ok(std::move(view));
}

void UploadService::discard_artifacts(const model::UploadSession& session) {
    if (auto removed = chunks_.remove_session(session.id); removed.is_error()) {
        spdlog::warn("[UploadService] session={} chunk files not removed: {}", session.id, removed.error().message);
    }
    if (auto removed = repository_.delete_chunks(session.id); removed.is_error()) {
        spdlog::warn("[UploadService] session={} chunk records not removed: {}", session.id,
                     removed.error().message);
    }
    if (!session.assembled_file_path.empty()) {
        std::error_code ec;
        fs::remove(session.assembled_file_path, ec);
        if (ec) {
            spdlog::warn("[UploadService] session={} assembled file not removed: {}", session.id, ec.message());
        }
    }
}

upl::Result<model::UploadSession> UploadService::cancel(const std::string& session_id, const std::string& reason) {
    auto loaded = repository_.get_session(session_id);
    if (loaded.is_error()) {
        return loaded;
    }
    const auto& current = loaded.value();
    if (current.status == SessionStatus::Cancelled) {
        return loaded;
    }
    if (!session::is_cancellable(current.status)) {
        return upl::Err<model::UploadSession>(ErrorKind::InvalidTransition,
            "Session " + session_id + " is " + model::to_string(current.status) + " and cannot be cancelled");
    }

    const auto now = clock_();
    storage::TransitionRequest request;
    request.expected_from = {SessionStatus::Pending, SessionStatus::Uploading,
                             SessionStatus::Assembling, SessionStatus::VirusScanning};
    request.to = SessionStatus::Cancelled;
    request.error_message = reason.empty() ? "Cancelled" : reason;
    request.at = now;
    request.events.push_back(session::make_event("session_cancelled", session::keys::kCancellation, {
        {"reason", *request.error_message},
        {"status_before", model::to_string(current.status)},
        {"cancelled_at", core::to_iso8601(now)},
    }, now));

    auto committed = repository_.apply_transition(session_id, request);
    if (committed.is_error()) {
        return committed;
    }

    discard_artifacts(committed.value());
    spdlog::info("[UploadService] session={} cancelled from {}", session_id, model::to_string(current.status));
    bus_.emit(events::SessionCancelledEvent{session_id, *request.error_message});
    return committed;
}

upl::Result<std::vector<model::UploadSession>> UploadService::list_sessions(
    const std::string& workspace_id, std::optional<SessionStatus> status, std::size_t limit) const {
    storage::SessionQuery query;
    query.workspace_id = workspace_id;
    if (status) {
        query.statuses = {*status};
    }
    query.limit = limit;
    query.order = storage::SessionQuery::Order::NewestFirst;
    return repository_.find_sessions(query);
}

upl::Result<model::Asset> UploadService::asset_for_session(const std::string& session_id) const {
    auto found = repository_.find_asset_by_session(session_id);
    if (found.is_error()) {
        return upl::Err<model::Asset>(found.error());
    }
    if (!found.value()) {
        return upl::Err<model::Asset>(ErrorKind::NotFound, "No asset for session " + session_id);
    }
    return upl::Ok(*found.value());
}

void UploadService::dispatch_assembly(const std::string& session_id) {
    runner_.submit("assemble:" + session_id,
        [this, session_id]() -> upl::Result<void> {
            auto assembled = assembler_.assemble(session_id);
            if (assembled.is_error()) {
                return upl::Err<void>(assembled.error());
            }
            dispatch_scan(session_id);
            return upl::Ok();
        },
        [this, session_id](const upl::Error& error) {
            if (auto failed = assembler_.fail(session_id, error); failed.is_error()) {
                spdlog::info("[UploadService] session={} assembly not failed: {}", session_id,
                             failed.error().message);
            }
        });
}

void UploadService::dispatch_scan(const std::string& session_id) {
    runner_.submit("scan:" + session_id,
        [this, session_id]() -> upl::Result<void> {
            auto scanned = gateway_.process(session_id);
            if (scanned.is_error()) {
                return upl::Err<void>(scanned.error());
            }
            if (scanned.value().verdict != ScanVerdict::Infected) {
                dispatch_finalization(session_id);
            }
            return upl::Ok();
        },
        [this, session_id](const upl::Error& error) {
            if (auto failed = gateway_.fail(session_id, error); failed.is_error()) {
                spdlog::info("[UploadService] session={} scan not failed: {}", session_id,
                             failed.error().message);
            }
        });
}

void UploadService::dispatch_finalization(const std::string& session_id) {
    runner_.submit("finalize:" + session_id,
        [this, session_id]() -> upl::Result<void> {
            auto finalized = finalizer_.finalize(session_id);
            if (finalized.is_error()) {
                return upl::Err<void>(finalized.error());
            }
            return upl::Ok();
        },
        [this, session_id](const upl::Error& error) {
            if (auto failed = finalizer_.fail(session_id, error); failed.is_error()) {
                spdlog::info("[UploadService] session={} finalization not failed: {}", session_id,
                             failed.error().message);
            }
        });
}

} // namespace upl::pipeline
