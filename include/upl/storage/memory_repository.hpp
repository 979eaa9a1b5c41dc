#pragma once

#include "upl/storage/session_repository.hpp"

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <unordered_map>

namespace upl::storage {

/**
 * @brief In-process SessionRepository
 *
 * THREAD SAFETY:
 * One std::shared_mutex guards every map. Reads take a shared_lock,
 * every mutation takes a unique_lock, so each compare-and-swap and each
 * slot claim is a single critical section.
 */
class MemoryRepository : public SessionRepository {
public:
    MemoryRepository() = default;

    MemoryRepository(const MemoryRepository&) = delete;
    MemoryRepository& operator=(const MemoryRepository&) = delete;

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

    [[nodiscard]] std::size_t session_count() const;

private:
    struct SessionRecord {
        model::UploadSession session;
        std::vector<session::SessionEvent> events;
        std::map<std::uint32_t, model::Chunk> chunks;
        std::uint64_t next_sequence = 1;
    };

    void append_locked(SessionRecord& record, session::SessionEvent& event);

    std::map<std::string, SessionRecord> sessions_;
    std::unordered_map<std::string, std::string> slots_;                 // slot key -> session id
    std::unordered_map<std::string, model::Asset> assets_;               // asset id -> asset
    std::unordered_map<std::string, std::string> asset_by_session_;      // session id -> asset id

    mutable std::shared_mutex mutex_;
};

} // namespace upl::storage
