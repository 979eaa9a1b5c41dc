/**
 * @file events.hpp
 * @brief Notifications emitted by the upload pipeline
 *
 * NAMING CONVENTION:
 * Past tense, one struct per fact: SessionCreatedEvent, ChunkStoredEvent.
 *
 * These are in-process notifications for logging and metrics. The durable
 * record of what happened to a session is its event log in the repository.
 */

#pragma once

#include "upl/model/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace upl::events {

/**
 * @brief A client declared a new upload
 *
 * WHO EMITS: UploadService::create_session
 */
struct SessionCreatedEvent {
    std::string session_id;
    std::string workspace_id;
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint32_t chunks_count = 0;
};

/**
 * @brief Bytes of one chunk were stored and verified
 *
 * WHO EMITS: UploadService::upload_chunk
 */
struct ChunkStoredEvent {
    std::string session_id;
    std::uint32_t chunk_number = 0;
    std::uint32_t chunks_count = 0;
    std::uint64_t bytes = 0;
};

/// WHO EMITS: Assembler, after the session moved to virus_scanning.
struct AssemblyCompletedEvent {
    std::string session_id;
    std::string assembled_path;
    std::uint64_t bytes = 0;
    std::uint32_t chunks_count = 0;
};

/**
 * @brief The scanner gateway recorded a verdict
 *
 * `verdict` is one of "clean", "infected", "skipped".
 */
struct ScanCompletedEvent {
    std::string session_id;
    std::string verdict;
    std::string scanner;
    std::string virus_name;
    std::chrono::milliseconds duration{0};
};

/// WHO EMITS: Finalizer, once per newly created asset.
struct AssetFinalizedEvent {
    std::string session_id;
    std::string asset_id;
    std::string filename;
    std::string content_type;
    std::uint64_t file_size = 0;
};

/**
 * @brief A session landed in a failure status
 *
 * WHO EMITS: any stage, and the cleanup sweeper for stuck sessions.
 */
struct SessionFailedEvent {
    std::string session_id;
    model::SessionStatus status = model::SessionStatus::Failed;
    std::string reason;
};

struct SessionCancelledEvent {
    std::string session_id;
    std::string reason;
};

/// WHO EMITS: CleanupSweeper::run_once
struct SweepCompletedEvent {
    std::size_t expired_removed = 0;
    std::size_t stuck_failed = 0;
    std::size_t errors = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace upl::events
