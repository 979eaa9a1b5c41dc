#pragma once

#include "upl/core/result.hpp"
#include "upl/core/time.hpp"
#include "upl/events/event_bus.hpp"
#include "upl/model/types.hpp"
#include "upl/storage/chunk_store.hpp"
#include "upl/storage/session_repository.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace upl::pipeline {

struct AssembledFile {
    std::filesystem::path path;
    std::uint64_t size = 0;
    std::uint32_t chunks_count = 0;
    model::UploadSession session;
};

struct AssemblyStatus {
    bool ready = false;
    model::SessionStatus status = model::SessionStatus::Pending;
    std::uint32_t completed_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::vector<std::uint32_t> missing_chunks;
};

/**
 * @brief Concatenates a session's chunks into one file
 *
 * Only a session observed in `assembling` is assembled. Each attempt
 * writes to its own uniquely named file; the attempt that wins the
 * assembling -> virus_scanning swap publishes its path, a losing attempt
 * deletes its file. Incomplete chunk sets, unreadable chunks and size
 * mismatches fail the session (Assembly, not retried); local write
 * failures are Storage and may be retried.
 */
class Assembler {
public:
    Assembler(storage::SessionRepository& repository,
              storage::ChunkStore& chunks,
              std::filesystem::path assembly_root,
              events::EventBus& bus,
              core::Clock clock = core::system_clock());

    /// Completeness of a chunk set: exactly 1..chunks_count, all completed.
    [[nodiscard]] static bool chunks_complete(std::uint32_t chunks_count, const std::vector<model::Chunk>& chunks);

    [[nodiscard]] static std::vector<std::uint32_t> missing_chunks(std::uint32_t chunks_count,
                                                                  const std::vector<model::Chunk>& chunks);

    /// Complete chunk set AND status `assembling`.
    [[nodiscard]] static bool can_assemble(const model::UploadSession& session,
                                           const std::vector<model::Chunk>& chunks);

    upl::Result<bool> can_assemble(const std::string& session_id) const;

    upl::Result<AssemblyStatus> assembly_status(const std::string& session_id) const;

    upl::Result<AssembledFile> assemble(const std::string& session_id);

    /// Moves an `assembling` session to `failed`; used when retries run out.
    upl::Result<model::UploadSession> fail(const std::string& session_id, const upl::Error& error);

private:
    upl::Result<std::uint64_t> concatenate(const std::vector<model::Chunk>& chunks,
                                           const std::filesystem::path& target) const;

    std::filesystem::path make_temp_path(const model::UploadSession& session) const;

    upl::Error abort_for_status(const std::string& session_id) const;

    storage::SessionRepository& repository_;
    storage::ChunkStore& chunks_;
    std::filesystem::path assembly_root_;
    events::EventBus& bus_;
    core::Clock clock_;
};

} // namespace upl::pipeline
