#include "upl/pipeline/assembler.hpp"

#include "upl/core/hash.hpp"
#include "upl/events/events.hpp"
#include "upl/session/event_log.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>

namespace upl::pipeline {
namespace fs = std::filesystem;

using model::SessionStatus;

Assembler::Assembler(storage::SessionRepository& repository,
                     storage::ChunkStore& chunks,
                     fs::path assembly_root,
                     events::EventBus& bus,
                     core::Clock clock)
    : repository_(repository),
      chunks_(chunks),
      assembly_root_(std::move(assembly_root)),
      bus_(bus),
      clock_(std::move(clock)) {}

bool Assembler::chunks_complete(std::uint32_t chunks_count, const std::vector<model::Chunk>& chunks) {
    if (chunks_count == 0 || chunks.size() != chunks_count) {
        return false;
    }
    std::set<std::uint32_t> seen;
    for (const auto& chunk : chunks) {
        if (chunk.status != model::ChunkStatus::Completed) {
            return false;
        }
        if (chunk.chunk_number < 1 || chunk.chunk_number > chunks_count) {
            return false;
        }
        if (!seen.insert(chunk.chunk_number).second) {
            return false;
        }
    }
    return seen.size() == chunks_count;
}

std::vector<std::uint32_t> Assembler::missing_chunks(std::uint32_t chunks_count,
                                                     const std::vector<model::Chunk>& chunks) {
    std::set<std::uint32_t> completed;
    for (const auto& chunk : chunks) {
        if (chunk.status == model::ChunkStatus::Completed) {
            completed.insert(chunk.chunk_number);
        }
    }
    std::vector<std::uint32_t> missing;
    for (std::uint32_t n = 1; n <= chunks_count; ++n) {
        if (completed.count(n) == 0) {
            missing.push_back(n);
        }
    }
    return missing;
}

bool Assembler::can_assemble(const model::UploadSession& session, const std::vector<model::Chunk>& chunks) {
    return session.status == SessionStatus::Assembling && chunks_complete(session.chunks_count, chunks);
}

upl::Result<bool> Assembler::can_assemble(const std::string& session_id) const {
    auto session = repository_.get_session(session_id);
    if (session.is_error()) {
        return upl::Err<bool>(session.error());
    }
    auto chunks = repository_.list_chunks(session_id);
    if (chunks.is_error()) {
        return upl::Err<bool>(chunks.error());
    }
    return upl::Ok(can_assemble(session.value(), chunks.value()));
}

upl::Result<AssemblyStatus> Assembler::assembly_status(const std::string& session_id) const {
    auto session = repository_.get_session(session_id);
    if (session.is_error()) {
        return upl::Err<AssemblyStatus>(session.error());
    }
    auto chunks = repository_.list_chunks(session_id);
    if (chunks.is_error()) {
        return upl::Err<AssemblyStatus>(chunks.error());
    }

    const auto& s = session.value();
    AssemblyStatus status;
    status.status = s.status;
    status.total_chunks = s.chunks_count;
    status.missing_chunks = missing_chunks(s.chunks_count, chunks.value());
    status.completed_chunks = s.chunks_count - static_cast<std::uint32_t>(status.missing_chunks.size());
    status.ready = chunks_complete(s.chunks_count, chunks.value());
    return upl::Ok(std::move(status));
}

fs::path Assembler::make_temp_path(const model::UploadSession& session) const {
    const auto extension = fs::path(session.filename).extension().string();
    return assembly_root_ / ("assembled_" + session.id + "_" + core::generate_id("", 8) + extension);
}

upl::Error Assembler::abort_for_status(const std::string& session_id) const {
    auto current = repository_.get_session(session_id);
    if (current.is_ok() && current.value().status == SessionStatus::Cancelled) {
        return upl::Error{ErrorKind::Cancelled, "Session " + session_id + " was cancelled during assembly"};
    }
    const std::string status = current.is_ok() ? model::to_string(current.value().status) : "unknown";
    return upl::Error{ErrorKind::InvalidTransition,
                      "Session " + session_id + " is no longer assembling (" + status + ")"};
}

upl::Result<std::uint64_t> Assembler::concatenate(const std::vector<model::Chunk>& chunks,
                                                  const fs::path& target) const {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return upl::Err<std::uint64_t>(ErrorKind::Storage, "Cannot create assembled file: " + target.string());
    }

    std::uint64_t written = 0;
    for (const auto& chunk : chunks) {
        auto copied = chunks_.read_into(chunk.storage_key, out);
        if (copied.is_error()) {
            if (copied.error().kind == ErrorKind::Storage && !out) {
                return upl::Err<std::uint64_t>(copied.error());
            }
            return upl::Err<std::uint64_t>(ErrorKind::Assembly,
                "Failed to read chunk " + std::to_string(chunk.chunk_number) + ": " + copied.error().message);
        }
        written += copied.value();
    }

    out.flush();
    if (!out) {
        return upl::Err<std::uint64_t>(ErrorKind::Storage, "Failed to flush assembled file: " + target.string());
    }
    return upl::Ok(written);
}

upl::Result<AssembledFile> Assembler::assemble(const std::string& session_id) {
    auto loaded = repository_.get_session(session_id);
    if (loaded.is_error()) {
        return upl::Err<AssembledFile>(loaded.error());
    }
    const auto session = loaded.value();
    if (session.status != SessionStatus::Assembling) {
        return upl::Err<AssembledFile>(abort_for_status(session_id));
    }

    auto listed = repository_.list_chunks(session_id);
    if (listed.is_error()) {
        return upl::Err<AssembledFile>(listed.error());
    }
    const auto& chunks = listed.value();

    if (!chunks_complete(session.chunks_count, chunks)) {
        const auto missing = missing_chunks(session.chunks_count, chunks);
        std::string message = "Incomplete chunk set: have " + std::to_string(chunks.size()) +
                              " of " + std::to_string(session.chunks_count);
        if (!missing.empty()) {
            message += ", missing";
            for (auto n : missing) {
                message += " " + std::to_string(n);
            }
        }
        auto failed = fail(session_id, upl::Error{ErrorKind::Assembly, message});
        if (failed.is_error() && failed.error().kind != ErrorKind::Assembly) {
            return upl::Err<AssembledFile>(failed.error());
        }
        return upl::Err<AssembledFile>(ErrorKind::Assembly, message);
    }

    std::error_code ec;
    fs::create_directories(assembly_root_, ec);
    if (ec && !fs::exists(assembly_root_)) {
        return upl::Err<AssembledFile>(ErrorKind::Storage,
                                       "Cannot create assembly directory " + assembly_root_.string());
    }

    const auto target = make_temp_path(session);
    spdlog::debug("[Assembler] session={} assembling {} chunks into {}", session_id, chunks.size(), target.string());

    auto written = concatenate(chunks, target);
    if (written.is_error() || written.value() != session.total_size) {
        fs::remove(target, ec);
        const auto error = written.is_error()
            ? written.error()
            : upl::Error{ErrorKind::Assembly,
                         "Assembled size " + std::to_string(written.value()) +
                         " does not match declared size " + std::to_string(session.total_size)};
        if (error.kind == ErrorKind::Assembly) {
            auto failed = fail(session_id, error);
            if (failed.is_error() && failed.error().kind != ErrorKind::Assembly) {
                return upl::Err<AssembledFile>(failed.error());
            }
        }
        return upl::Err<AssembledFile>(error);
    }

    const auto now = clock_();
    storage::TransitionRequest request;
    request.expected_from = {SessionStatus::Assembling};
    request.to = SessionStatus::VirusScanning;
    request.assembled_file_path = target.string();
    request.scan_queued_at = now;
    request.at = now;
    request.events.push_back(session::make_event("assembly_completed", session::keys::kAssembly, {
        {"assembled_at", core::to_iso8601(now)},
        {"file_size", written.value()},
        {"chunks_count", session.chunks_count},
    }, now));
    request.events.push_back(session::make_event("scan_queued", session::keys::kVirusScan, {
        {"status", "queued"},
        {"queued_at", core::to_iso8601(now)},
    }, now));

    auto committed = repository_.apply_transition(session_id, request);
    if (committed.is_error()) {
        fs::remove(target, ec);
        spdlog::info("[Assembler] session={} lost the assembling swap, discarded {}", session_id, target.string());
        return upl::Err<AssembledFile>(abort_for_status(session_id));
    }

    // The assembled file now owns the bytes; chunk cleanup is best effort.
    if (auto removed = chunks_.remove_session(session_id); removed.is_error()) {
        spdlog::warn("[Assembler] session={} chunk files not removed: {}", session_id, removed.error().message);
    }
    if (auto removed = repository_.delete_chunks(session_id); removed.is_error()) {
        spdlog::warn("[Assembler] session={} chunk records not removed: {}", session_id, removed.error().message);
    }

    bus_.emit(events::AssemblyCompletedEvent{session_id, target.string(), written.value(), session.chunks_count});

    AssembledFile file;
    file.path = target;
    file.size = written.value();
    file.chunks_count = session.chunks_count;
    file.session = committed.value();
    return upl::Ok(std::move(file));
}

upl::Result<model::UploadSession> Assembler::fail(const std::string& session_id, const upl::Error& error) {
    const auto now = clock_();
    storage::TransitionRequest request;
    request.expected_from = {SessionStatus::Assembling};
    request.to = SessionStatus::Failed;
    request.error_message = error.message;
    request.at = now;
    request.events.push_back(session::make_event("assembly_failed", session::keys::kAssembly, {
        {"error", error.message},
        {"error_kind", upl::to_string(error.kind)},
        {"failed_at", core::to_iso8601(now)},
    }, now));

    auto committed = repository_.apply_transition(session_id, request);
    if (committed.is_error()) {
        spdlog::info("[Assembler] session={} not failed ({}), status moved on", session_id,
                     committed.error().message);
        return upl::Err<model::UploadSession>(abort_for_status(session_id));
    }

    bus_.emit(events::SessionFailedEvent{session_id, SessionStatus::Failed, error.message});
    return committed;
}

} // namespace upl::pipeline
