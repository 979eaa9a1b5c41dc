#pragma once

/**
 * @file types.hpp
 * @brief Domain records of the chunked upload pipeline
 *
 * WHY THIS FILE EXISTS:
 * A large file reaches us as numbered chunks over many requests. These
 * records describe one transfer attempt (UploadSession), each piece of it
 * (Chunk) and the permanent result (Asset), so every stage of the pipeline
 * talks about the same data.
 *
 * HOW IT INTEGRATES:
 * - SessionRepository (storage/session_repository.hpp) persists all three
 * - The state machine (session/state_machine.hpp) governs SessionStatus
 * - Assembler, ScannerGateway and Finalizer read and advance sessions
 * - UploadService builds the client-facing views from them
 *
 * DESIGN DECISIONS:
 * - Plain structs: behavior lives in the stages, not in the records
 * - Free-form metadata is NOT a field here; it is folded from the
 *   append-only event log (session/event_log.hpp) on demand
 */

#include "upl/core/time.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace upl::model {

/**
 * @brief Phase of an upload session
 *
 * HAPPY PATH:
 * Pending → Uploading → Assembling → VirusScanning → Completed
 *
 * TERMINAL FAILURES:
 * Failed (assembly or expiry), VirusScanFailed (infected or scan error),
 * FinalizationFailed (asset could not be produced), Cancelled (client).
 *
 * The legal edges live in one table in session/state_machine.cpp.
 */
enum class SessionStatus {
    Pending,
    Uploading,
    Assembling,
    VirusScanning,
    Completed,
    Failed,
    FinalizationFailed,
    VirusScanFailed,
    Cancelled
};

/// Lifecycle of a single chunk record.
enum class ChunkStatus {
    Pending,     // Record exists, bytes not yet verified
    Completed,   // Bytes durably stored and checksum verified
    Failed       // Storing the bytes failed
};

const char* to_string(SessionStatus status);
std::optional<SessionStatus> parse_session_status(std::string_view text);

const char* to_string(ChunkStatus status);
std::optional<ChunkStatus> parse_chunk_status(std::string_view text);

/**
 * @brief One logical file-transfer attempt
 *
 * IDENTITY:
 * `id` is opaque ("ses_<hex>"). The (workspace_id, container_id, filename)
 * triple is unique among sessions that still hold their filename slot.
 *
 * FIELDS EXPLAINED:
 * - total_size / chunks_count: declared by the client at creation
 * - assembled_file_path: set by the Assembler, empty before that
 * - error_message: human-readable reason once a failure status is reached
 * - scan_queued_at / scan_completed_at: stamped by Assembler / ScannerGateway
 */
struct UploadSession {
    std::string id;
    std::string workspace_id;
    std::optional<std::string> container_id;
    std::string user_id;
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint32_t chunks_count = 0;
    SessionStatus status = SessionStatus::Pending;
    std::string assembled_file_path;
    std::string error_message;
    core::TimePoint created_at{};
    core::TimePoint updated_at{};
    std::optional<core::TimePoint> scan_queued_at;
    std::optional<core::TimePoint> scan_completed_at;
};

/**
 * @brief One numbered piece of a session's payload
 *
 * (session_id, chunk_number) is unique; re-uploading the same number
 * replaces the record. `storage_key` points into the ChunkStore.
 */
struct Chunk {
    std::string session_id;
    std::uint32_t chunk_number = 0;
    std::uint64_t size = 0;
    std::string checksum;
    ChunkStatus status = ChunkStatus::Pending;
    std::string storage_key;
    std::string error;
    core::TimePoint updated_at{};
};

/**
 * @brief Stable handle to bytes held by a DurableStorage backend
 *
 * Enough to locate the bytes again later (e.g. to build a download URL)
 * without knowing the backend's internals.
 */
struct StorageReference {
    std::string backend;
    std::string key;
    std::string filename;
    std::string content_type;
    std::uint64_t size = 0;
};

/**
 * @brief Permanent artifact produced by a finalized session
 *
 * Exactly one Asset exists per finalized session; `session_id` is unique
 * among assets. `metadata` carries provenance (originating session, chunk
 * count, scan verdict, upload duration) plus the client's own keys.
 */
struct Asset {
    std::string id;
    std::string session_id;
    std::string workspace_id;
    std::optional<std::string> container_id;
    std::string user_id;
    std::string filename;
    std::uint64_t file_size = 0;
    std::string content_type;
    nlohmann::json metadata = nlohmann::json::object();
    StorageReference storage;
    core::TimePoint created_at{};
};

nlohmann::json to_json(const UploadSession& session);
nlohmann::json to_json(const Chunk& chunk);
nlohmann::json to_json(const StorageReference& reference);
nlohmann::json to_json(const Asset& asset);

} // namespace upl::model
