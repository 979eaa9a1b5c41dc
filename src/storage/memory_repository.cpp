#include "upl/storage/memory_repository.hpp"

#include "upl/session/state_machine.hpp"

#include <algorithm>
#include <mutex>

namespace upl::storage {
namespace {

bool status_in(const std::vector<SessionStatus>& statuses, SessionStatus status) {
    return std::find(statuses.begin(), statuses.end(), status) != statuses.end();
}

std::string not_found(const std::string& session_id) {
    return "Upload session not found: " + session_id;
}

} // namespace

void MemoryRepository::append_locked(SessionRecord& record, session::SessionEvent& event) {
    event.sequence = record.next_sequence++;
    record.events.push_back(event);
}

upl::Result<model::UploadSession> MemoryRepository::create_session(const model::UploadSession& session,
                                                                   std::vector<session::SessionEvent> initial_events) {
    std::unique_lock lock(mutex_);

    if (sessions_.count(session.id) > 0) {
        return upl::Err<model::UploadSession>(ErrorKind::Conflict, "Session id already exists: " + session.id);
    }

    const auto key = slot_key(session.workspace_id, session.container_id, session.filename);
    if (session::holds_filename_slot(session.status)) {
        const auto slot = slots_.find(key);
        if (slot != slots_.end()) {
            return upl::Err<model::UploadSession>(ErrorKind::Conflict,
                "An active upload session already exists for " + session.filename + " (" + slot->second + ")");
        }
        slots_.emplace(key, session.id);
    }

    SessionRecord record;
    record.session = session;
    for (auto& event : initial_events) {
        append_locked(record, event);
    }
    sessions_.emplace(session.id, std::move(record));
    return upl::Ok(session);
}

upl::Result<model::UploadSession> MemoryRepository::get_session(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return upl::Err<model::UploadSession>(ErrorKind::NotFound, not_found(session_id));
    }
    return upl::Ok(it->second.session);
}

upl::Result<model::UploadSession> MemoryRepository::apply_transition(const std::string& session_id,
                                                                     const TransitionRequest& request) {
    std::unique_lock lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return upl::Err<model::UploadSession>(ErrorKind::NotFound, not_found(session_id));
    }

    auto& record = it->second;
    const auto current = record.session.status;
    if (!status_in(request.expected_from, current)) {
        return upl::Err<model::UploadSession>(ErrorKind::InvalidTransition,
            std::string("Session ") + session_id + " is " + model::to_string(current) +
            ", cannot move to " + model::to_string(request.to));
    }
    if (auto valid = session::validate_transition(current, request.to); valid.is_error()) {
        return upl::Err<model::UploadSession>(valid.error());
    }

    auto& s = record.session;
    if (session::holds_filename_slot(current) && !session::holds_filename_slot(request.to)) {
        slots_.erase(slot_key(s.workspace_id, s.container_id, s.filename));
    }

    s.status = request.to;
    s.updated_at = request.at;
    if (request.assembled_file_path) {
        s.assembled_file_path = *request.assembled_file_path;
    }
    if (request.error_message) {
        s.error_message = *request.error_message;
    }
    if (request.scan_queued_at) {
        s.scan_queued_at = request.scan_queued_at;
    }
    if (request.scan_completed_at) {
        s.scan_completed_at = request.scan_completed_at;
    }

    for (auto event : request.events) {
        event.status_after = request.to;
        append_locked(record, event);
    }
    return upl::Ok(s);
}

upl::Result<session::SessionEvent> MemoryRepository::append_event(const std::string& session_id,
                                                                  session::SessionEvent event,
                                                                  const std::vector<SessionStatus>& required_status) {
    std::unique_lock lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return upl::Err<session::SessionEvent>(ErrorKind::NotFound, not_found(session_id));
    }
    auto& record = it->second;
    if (!required_status.empty() && !status_in(required_status, record.session.status)) {
        return upl::Err<session::SessionEvent>(ErrorKind::InvalidTransition,
            std::string("Session ") + session_id + " is " + model::to_string(record.session.status));
    }
    event.status_after = record.session.status;
    append_locked(record, event);
    return upl::Ok(event);
}

upl::Result<std::vector<session::SessionEvent>> MemoryRepository::events(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return upl::Err<std::vector<session::SessionEvent>>(ErrorKind::NotFound, not_found(session_id));
    }
    return upl::Ok(it->second.events);
}

upl::Result<void> MemoryRepository::upsert_chunk(const model::Chunk& chunk,
                                                 const std::vector<SessionStatus>& required_status,
                                                 const ChunkCommit& on_accept) {
    std::unique_lock lock(mutex_);
    const auto it = sessions_.find(chunk.session_id);
    if (it == sessions_.end()) {
        return upl::Err<void>(ErrorKind::NotFound, not_found(chunk.session_id));
    }
    if (!required_status.empty() && !status_in(required_status, it->second.session.status)) {
        return upl::Err<void>(ErrorKind::InvalidTransition,
            std::string("Session ") + chunk.session_id + " no longer accepts chunks (" +
            model::to_string(it->second.session.status) + ")");
    }
    if (on_accept) {
        if (auto accepted = on_accept(); accepted.is_error()) {
            return accepted;
        }
    }
    it->second.chunks[chunk.chunk_number] = chunk;
    auto& session = it->second.session;
    session.updated_at = std::max(session.updated_at, chunk.updated_at);
    return upl::Ok();
}

upl::Result<std::vector<model::Chunk>> MemoryRepository::list_chunks(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return upl::Err<std::vector<model::Chunk>>(ErrorKind::NotFound, not_found(session_id));
    }
    std::vector<model::Chunk> chunks;
    chunks.reserve(it->second.chunks.size());
    for (const auto& [number, chunk] : it->second.chunks) {
        chunks.push_back(chunk);
    }
    return upl::Ok(std::move(chunks));
}

upl::Result<std::size_t> MemoryRepository::delete_chunks(const std::string& session_id) {
    std::unique_lock lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return upl::Err<std::size_t>(ErrorKind::NotFound, not_found(session_id));
    }
    const auto removed = it->second.chunks.size();
    it->second.chunks.clear();
    return upl::Ok(removed);
}

upl::Result<void> MemoryRepository::remove_session(const std::string& session_id) {
    std::unique_lock lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return upl::Err<void>(ErrorKind::NotFound, not_found(session_id));
    }
    const auto& s = it->second.session;
    const auto key = slot_key(s.workspace_id, s.container_id, s.filename);
    const auto slot = slots_.find(key);
    if (slot != slots_.end() && slot->second == session_id) {
        slots_.erase(slot);
    }
    sessions_.erase(it);
    return upl::Ok();
}

upl::Result<std::vector<model::UploadSession>> MemoryRepository::find_sessions(const SessionQuery& query) const {
    std::shared_lock lock(mutex_);

    auto matches = [&query](const model::UploadSession& s) {
        if (!query.statuses.empty() && !status_in(query.statuses, s.status)) {
            return false;
        }
        if (query.workspace_id && s.workspace_id != *query.workspace_id) {
            return false;
        }
        if (query.updated_before && !(s.updated_at < *query.updated_before)) {
            return false;
        }
        return true;
    };

    std::vector<model::UploadSession> result;
    if (query.order == SessionQuery::Order::ById) {
        auto it = query.after_id ? sessions_.upper_bound(*query.after_id) : sessions_.begin();
        for (; it != sessions_.end() && result.size() < query.limit; ++it) {
            if (matches(it->second.session)) {
                result.push_back(it->second.session);
            }
        }
        return upl::Ok(std::move(result));
    }

    for (const auto& [id, record] : sessions_) {
        if (matches(record.session)) {
            result.push_back(record.session);
        }
    }
    std::sort(result.begin(), result.end(), [](const model::UploadSession& a, const model::UploadSession& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return a.id > b.id;
    });
    if (result.size() > query.limit) {
        result.resize(query.limit);
    }
    return upl::Ok(std::move(result));
}

upl::Result<model::Asset> MemoryRepository::insert_asset_once(const model::Asset& asset) {
    std::unique_lock lock(mutex_);
    const auto existing = asset_by_session_.find(asset.session_id);
    if (existing != asset_by_session_.end()) {
        return upl::Ok(assets_.at(existing->second));
    }
    if (assets_.count(asset.id) > 0) {
        return upl::Err<model::Asset>(ErrorKind::Conflict, "Asset id already exists: " + asset.id);
    }
    assets_.emplace(asset.id, asset);
    asset_by_session_.emplace(asset.session_id, asset.id);
    return upl::Ok(asset);
}

upl::Result<std::optional<model::Asset>> MemoryRepository::find_asset_by_session(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    const auto it = asset_by_session_.find(session_id);
    if (it == asset_by_session_.end()) {
        return upl::Ok(std::optional<model::Asset>{});
    }
    return upl::Ok(std::optional<model::Asset>(assets_.at(it->second)));
}

upl::Result<model::Asset> MemoryRepository::get_asset(const std::string& asset_id) const {
    std::shared_lock lock(mutex_);
    const auto it = assets_.find(asset_id);
    if (it == assets_.end()) {
        return upl::Err<model::Asset>(ErrorKind::NotFound, "Asset not found: " + asset_id);
    }
    return upl::Ok(it->second);
}

upl::Result<std::vector<model::Asset>> MemoryRepository::list_assets(const std::string& workspace_id) const {
    std::shared_lock lock(mutex_);
    std::vector<model::Asset> result;
    for (const auto& [id, asset] : assets_) {
        if (asset.workspace_id == workspace_id) {
            result.push_back(asset);
        }
    }
    std::sort(result.begin(), result.end(), [](const model::Asset& a, const model::Asset& b) {
        return a.created_at < b.created_at || (a.created_at == b.created_at && a.id < b.id);
    });
    return upl::Ok(std::move(result));
}

std::size_t MemoryRepository::session_count() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

} // namespace upl::storage
