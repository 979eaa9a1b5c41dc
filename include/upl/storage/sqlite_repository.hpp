#pragma once

#include "upl/storage/session_repository.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

struct sqlite3;

namespace upl::storage {

/**
 * @brief SessionRepository on a SQLite database file
 *
 * The filename slot is a partial UNIQUE index over sessions whose status
 * still holds it, so the gate holds across processes sharing the file
 * (e.g. the service and the cleanup daemon). Status changes are
 * `UPDATE ... WHERE id = ? AND status = ?` inside BEGIN IMMEDIATE
 * transactions, with the appended events in the same transaction.
 *
 * One connection per instance, serialized by a mutex.
 */
class SqliteRepository : public SessionRepository {
public:
    /// Opens (creating if needed) the database and applies the schema.
    static upl::Result<std::unique_ptr<SqliteRepository>> open(const std::filesystem::path& path);

    ~SqliteRepository() override;

    SqliteRepository(const SqliteRepository&) = delete;
    SqliteRepository& operator=(const SqliteRepository&) = delete;

    upl::Result<model::UploadSession> create_session(const model::UploadSession& session,
                                                     std::vector<session::SessionEvent> initial_events) override;
    upl::Result<model::UploadSession> get_session(const std::string& session_id) const override;
    upl::Result<model::UploadSession> apply_transition(const std::string& session_id,
                                                       const TransitionRequest& request) override;
    upl::Result<session::SessionEvent> append_event(const std::string& session_id,
                                                    session::SessionEvent event,
                                                    const std::vector<SessionStatus>& required_status = {}) override;
    upl::Result<std::vector<session::SessionEvent>> events(const std::string& session_id) const override;

    upl::Result<void> upsert_chunk(const model::Chunk& chunk,
                                   const std::vector<SessionStatus>& required_status,
                                   const ChunkCommit& on_accept = {}) override;
    upl::Result<std::vector<model::Chunk>> list_chunks(const std::string& session_id) const override;
    upl::Result<std::size_t> delete_chunks(const std::string& session_id) override;

    upl::Result<void> remove_session(const std::string& session_id) override;
    upl::Result<std::vector<model::UploadSession>> find_sessions(const SessionQuery& query) const override;

    upl::Result<model::Asset> insert_asset_once(const model::Asset& asset) override;
    upl::Result<std::optional<model::Asset>> find_asset_by_session(const std::string& session_id) const override;
    upl::Result<model::Asset> get_asset(const std::string& asset_id) const override;
    upl::Result<std::vector<model::Asset>> list_assets(const std::string& workspace_id) const override;

private:
    explicit SqliteRepository(sqlite3* db);

    upl::Result<void> create_schema();

    upl::Result<model::UploadSession> load_session_locked(const std::string& session_id) const;
    upl::Result<session::SessionEvent> insert_event_locked(const std::string& session_id,
                                                           session::SessionEvent event);

    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace upl::storage
