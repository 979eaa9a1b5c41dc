#pragma once

/**
 * @file session_repository.hpp
 * @brief Authoritative store for sessions, chunks, events and assets
 *
 * WHY THIS FILE EXISTS:
 * Every correctness guarantee of the pipeline is enforced here, at the
 * storage layer, not in the callers:
 * - the filename slot of a (workspace, container, filename) triple is
 *   claimed atomically at creation (two racing creates: one wins)
 * - each stage commits its outcome through a single compare-and-swap on
 *   the session status, together with the event it appends
 * - an asset is inserted at most once per session
 *
 * IMPLEMENTATIONS:
 * - MemoryRepository (storage/memory_repository.hpp): in-process maps
 * - SqliteRepository (storage/sqlite_repository.hpp): SQLite file with a
 *   partial unique index over slot-holding sessions
 */

#include "upl/core/result.hpp"
#include "upl/model/types.hpp"
#include "upl/session/event_log.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace upl::storage {

using model::SessionStatus;

/**
 * @brief One atomic status change
 *
 * Applied only when the session's current status is in `expected_from`
 * AND `from -> to` is a legal edge. On success every optional field that
 * is set is written and `events` are appended in order, all in the same
 * commit. Otherwise nothing changes and InvalidTransition is returned.
 */
struct TransitionRequest {
    std::vector<SessionStatus> expected_from;
    SessionStatus to = SessionStatus::Pending;
    std::vector<session::SessionEvent> events;
    std::optional<std::string> assembled_file_path;
    std::optional<std::string> error_message;
    std::optional<core::TimePoint> scan_queued_at;
    std::optional<core::TimePoint> scan_completed_at;
    core::TimePoint at{};
};

/// Runs inside upsert_chunk after the status check passed and before the
/// record is written; an error aborts the upsert and is returned as is.
using ChunkCommit = std::function<upl::Result<void>()>;

struct SessionQuery {
    enum class Order { ById, NewestFirst };

    std::vector<SessionStatus> statuses;          ///< Empty matches every status
    std::optional<std::string> workspace_id;
    std::optional<core::TimePoint> updated_before;
    std::optional<std::string> after_id;          ///< Keyset cursor, ById order only
    std::size_t limit = 50;
    Order order = Order::ById;
};

class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    /// Conflict when another slot-holding session owns the filename slot.
    virtual upl::Result<model::UploadSession> create_session(const model::UploadSession& session,
                                                             std::vector<session::SessionEvent> initial_events) = 0;

    virtual upl::Result<model::UploadSession> get_session(const std::string& session_id) const = 0;

    virtual upl::Result<model::UploadSession> apply_transition(const std::string& session_id,
                                                               const TransitionRequest& request) = 0;

    /// Appends without changing status; `required_status`, when non-empty,
    /// must contain the current status or InvalidTransition is returned.
    virtual upl::Result<session::SessionEvent> append_event(const std::string& session_id,
                                                            session::SessionEvent event,
                                                            const std::vector<SessionStatus>& required_status = {}) = 0;

    virtual upl::Result<std::vector<session::SessionEvent>> events(const std::string& session_id) const = 0;

    /// Inserts or replaces the (session, chunk_number) record while the
    /// session status is one of `required_status`, and moves the session's
    /// updated_at forward to the chunk's. `on_accept` runs under the same
    /// gate, so no status change can slip in between it and the record.
    virtual upl::Result<void> upsert_chunk(const model::Chunk& chunk,
                                           const std::vector<SessionStatus>& required_status,
                                           const ChunkCommit& on_accept = {}) = 0;

    /// Chunks ordered by chunk number.
    virtual upl::Result<std::vector<model::Chunk>> list_chunks(const std::string& session_id) const = 0;

    virtual upl::Result<std::size_t> delete_chunks(const std::string& session_id) = 0;

    /// Drops the session with its chunks and events. Assets are kept.
    virtual upl::Result<void> remove_session(const std::string& session_id) = 0;

    virtual upl::Result<std::vector<model::UploadSession>> find_sessions(const SessionQuery& query) const = 0;

    /// Returns the stored asset; if the session already has one, that one.
    virtual upl::Result<model::Asset> insert_asset_once(const model::Asset& asset) = 0;

    virtual upl::Result<std::optional<model::Asset>> find_asset_by_session(const std::string& session_id) const = 0;

    virtual upl::Result<model::Asset> get_asset(const std::string& asset_id) const = 0;

    virtual upl::Result<std::vector<model::Asset>> list_assets(const std::string& workspace_id) const = 0;
};

/// Slot component for a container; an absent container differs from "".
std::string container_slot(const std::optional<std::string>& container_id);

/// Key identifying a filename slot.
std::string slot_key(const std::string& workspace_id,
                     const std::optional<std::string>& container_id,
                     const std::string& filename);

} // namespace upl::storage
