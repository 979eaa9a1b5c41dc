#pragma once

#include "upl/core/config.hpp"
#include "upl/core/result.hpp"
#include "upl/core/time.hpp"
#include "upl/events/event_bus.hpp"
#include "upl/model/types.hpp"
#include "upl/pipeline/assembler.hpp"
#include "upl/pipeline/finalizer.hpp"
#include "upl/pipeline/job_runner.hpp"
#include "upl/pipeline/scanner_gateway.hpp"
#include "upl/storage/chunk_store.hpp"
#include "upl/storage/session_repository.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace upl::pipeline {

struct CreateSessionRequest {
    std::string workspace_id;
    std::optional<std::string> container_id;
    std::string user_id;
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint32_t chunks_count = 0;
    nlohmann::json metadata = nlohmann::json::object();   ///< Client keys, copied onto the Asset
};

struct ChunkUpload {
    std::string session_id;
    std::uint32_t chunk_number = 0;
    std::vector<std::uint8_t> data;
    std::optional<std::string> checksum;   ///< FNV-1a-64 hex of `data`
};

struct SessionStatusView {
    model::UploadSession session;
    std::uint32_t completed_chunks = 0;
    std::vector<std::uint32_t> missing_chunks;
    double progress = 0.0;   ///< Percent, two decimals
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t remaining_bytes = 0;
    std::uint64_t recommended_chunk_size = 0;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::string> asset_id;
};

nlohmann::json to_json(const SessionStatusView& view);

/**
 * @brief Client-facing operations of the upload pipeline
 *
 * Synchronous calls (create, chunk upload, status, cancel) run on the
 * caller's thread. Assembly, scanning and finalization are submitted to the
 * JobRunner, each stage dispatching the next once its transition committed:
 *
 *   upload_chunk / complete_upload
 *        -> [assemble] -> [scan] -> [finalize]
 *
 * When a stage's retries run out its fail() lands the session in the
 * stage's failure status.
 */
class UploadService {
public:
    UploadService(core::PipelineConfig config,
                  storage::SessionRepository& repository,
                  storage::ChunkStore& chunks,
                  Assembler& assembler,
                  ScannerGateway& gateway,
                  Finalizer& finalizer,
                  JobRunner& runner,
                  events::EventBus& bus,
                  core::Clock clock = core::system_clock());

    upl::Result<model::UploadSession> create_session(const CreateSessionRequest& request);

    upl::Result<model::Chunk> upload_chunk(const ChunkUpload& upload);

    /// Moves a fully uploaded session to `assembling`; no-op once past uploading.
    upl::Result<model::UploadSession> complete_upload(const std::string& session_id);

    upl::Result<SessionStatusView> status(const std::string& session_id) const;

    upl::Result<model::UploadSession> cancel(const std::string& session_id, const std::string& reason);

    upl::Result<std::vector<model::UploadSession>> list_sessions(const std::string& workspace_id,
                                                                 std::optional<model::SessionStatus> status = {},
                                                                 std::size_t limit = 50) const;

    upl::Result<model::Asset> asset_for_session(const std::string& session_id) const;

    void dispatch_assembly(const std::string& session_id);
    void dispatch_scan(const std::string& session_id);
    void dispatch_finalization(const std::string& session_id);

    [[nodiscard]] static std::uint64_t recommended_chunk_size(std::uint64_t total_size);

    static upl::Result<void> validate_filename(const std::string& filename, std::size_t max_length);

    /// "invoice.pdf.exe": the last two dot-separated parts both look like extensions.
    [[nodiscard]] static bool has_multiple_extensions(const std::string& filename);

private:
    upl::Result<void> validate(const CreateSessionRequest& request) const;

    /// pending|uploading -> assembling; false when another caller got there first.
    upl::Result<bool> begin_assembly(const std::string& session_id, std::uint32_t chunks_received);

    void mark_uploading(const model::UploadSession& session);

    /// Records the chunk as failed and returns the Storage error for the caller.
    upl::Result<model::Chunk> record_failed_chunk(model::Chunk chunk, const upl::Error& cause);

    void discard_artifacts(const model::UploadSession& session);

    core::PipelineConfig config_;
    storage::SessionRepository& repository_;
    storage::ChunkStore& chunks_;
    Assembler& assembler_;
    ScannerGateway& gateway_;
    Finalizer& finalizer_;
    JobRunner& runner_;
    events::EventBus& bus_;
    core::Clock clock_;
};

} // namespace upl::pipeline
