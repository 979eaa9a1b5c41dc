#include "upl/storage/sqlite_repository.hpp"

#include "upl/session/state_machine.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <algorithm>
#include <sstream>

namespace upl::storage {
namespace {

const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS upload_sessions (
        id TEXT PRIMARY KEY,
        workspace_id TEXT NOT NULL,
        container_id TEXT,
        container_slot TEXT NOT NULL,
        user_id TEXT NOT NULL,
        filename TEXT NOT NULL,
        total_size INTEGER NOT NULL,
        chunks_count INTEGER NOT NULL,
        status TEXT NOT NULL,
        assembled_file_path TEXT NOT NULL DEFAULT '',
        error_message TEXT NOT NULL DEFAULT '',
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL,
        scan_queued_at INTEGER,
        scan_completed_at INTEGER
    );

    CREATE UNIQUE INDEX IF NOT EXISTS idx_upload_sessions_active_slot
        ON upload_sessions(workspace_id, container_slot, filename)
        WHERE status IN ('pending', 'uploading', 'assembling', 'virus_scanning');

    CREATE INDEX IF NOT EXISTS idx_upload_sessions_status_updated
        ON upload_sessions(status, updated_at);

    CREATE TABLE IF NOT EXISTS upload_chunks (
        session_id TEXT NOT NULL,
        chunk_number INTEGER NOT NULL,
        size INTEGER NOT NULL,
        checksum TEXT NOT NULL,
        status TEXT NOT NULL,
        storage_key TEXT NOT NULL,
        error TEXT NOT NULL DEFAULT '',
        updated_at INTEGER NOT NULL,
        PRIMARY KEY (session_id, chunk_number),
        FOREIGN KEY (session_id) REFERENCES upload_sessions(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS session_events (
        session_id TEXT NOT NULL,
        sequence INTEGER NOT NULL,
        type TEXT NOT NULL,
        key TEXT NOT NULL,
        payload TEXT NOT NULL,
        status_after TEXT,
        at INTEGER NOT NULL,
        PRIMARY KEY (session_id, sequence),
        FOREIGN KEY (session_id) REFERENCES upload_sessions(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS assets (
        id TEXT PRIMARY KEY,
        session_id TEXT NOT NULL UNIQUE,
        workspace_id TEXT NOT NULL,
        container_id TEXT,
        user_id TEXT NOT NULL,
        filename TEXT NOT NULL,
        file_size INTEGER NOT NULL,
        content_type TEXT NOT NULL,
        metadata TEXT NOT NULL,
        storage TEXT NOT NULL,
        created_at INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_assets_workspace ON assets(workspace_id);
)";

const char* kSessionColumns =
    "id, workspace_id, container_id, user_id, filename, total_size, chunks_count, status, "
    "assembled_file_path, error_message, created_at, updated_at, scan_queued_at, scan_completed_at";

const char* kAssetColumns =
    "id, session_id, workspace_id, container_id, user_id, filename, file_size, content_type, "
    "metadata, storage, created_at";

upl::Error translate(sqlite3* db, int rc, const std::string& what) {
    std::string detail = what + ": " + sqlite3_errmsg(db);
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return upl::Error{ErrorKind::Storage, std::move(detail)};
        case SQLITE_CONSTRAINT:
            return upl::Error{ErrorKind::Conflict, std::move(detail)};
        default:
            return upl::Error{ErrorKind::Internal, std::move(detail)};
    }
}

upl::Result<void> exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        auto error = translate(db, rc, "exec");
        error.message = message;
        return upl::Err<void>(std::move(error));
    }
    return upl::Ok();
}

/// Prepared statement, finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] bool ok() const noexcept { return rc_ == SQLITE_OK; }
    [[nodiscard]] upl::Error error(const std::string& what) const { return translate(db_, rc_, what); }

    void bind(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind(int idx, const std::optional<std::string>& value) {
        if (value) {
            bind(idx, *value);
        } else {
            sqlite3_bind_null(stmt_, idx);
        }
    }

    void bind(int idx, std::int64_t value) {
        sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
    }

    void bind(int idx, const std::optional<core::TimePoint>& value) {
        if (value) {
            bind(idx, core::to_unix_millis(*value));
        } else {
            sqlite3_bind_null(stmt_, idx);
        }
    }

    int step() {
        rc_ = sqlite3_step(stmt_);
        return rc_;
    }

    [[nodiscard]] bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    [[nodiscard]] std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }

    [[nodiscard]] std::optional<std::string> optional_text(int col) const {
        if (is_null(col)) {
            return std::nullopt;
        }
        return text(col);
    }

    [[nodiscard]] std::int64_t int64(int col) const {
        return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
    }

    [[nodiscard]] std::optional<core::TimePoint> optional_time(int col) const {
        if (is_null(col)) {
            return std::nullopt;
        }
        return core::from_unix_millis(int64(col));
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_OK;
};

/// BEGIN IMMEDIATE on construction via begin(); rolls back unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {}

    ~Transaction() {
        if (active_) {
            auto res = exec(db_, "ROLLBACK;");
            if (res.is_error()) {
                spdlog::warn("[SqliteRepository] rollback failed: {}", res.error().message);
            }
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    upl::Result<void> begin() {
        auto res = exec(db_, "BEGIN IMMEDIATE;");
        active_ = res.is_ok();
        return res;
    }

    upl::Result<void> commit() {
        auto res = exec(db_, "COMMIT;");
        if (res.is_ok()) {
            active_ = false;
        }
        return res;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

std::string status_list(const std::vector<SessionStatus>& statuses) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < statuses.size(); ++i) {
        oss << (i == 0 ? "" : ",") << '?';
    }
    return oss.str();
}

bool status_in(const std::vector<SessionStatus>& statuses, SessionStatus status) {
    return std::find(statuses.begin(), statuses.end(), status) != statuses.end();
}

upl::Result<model::UploadSession> read_session(const Statement& st) {
    model::UploadSession s;
    s.id = st.text(0);
    s.workspace_id = st.text(1);
    s.container_id = st.optional_text(2);
    s.user_id = st.text(3);
    s.filename = st.text(4);
    s.total_size = static_cast<std::uint64_t>(st.int64(5));
    s.chunks_count = static_cast<std::uint32_t>(st.int64(6));
    const auto status = model::parse_session_status(st.text(7));
    if (!status) {
        return upl::Err<model::UploadSession>(ErrorKind::Internal, "Unknown session status in database: " + st.text(7));
    }
    s.status = *status;
    s.assembled_file_path = st.text(8);
    s.error_message = st.text(9);
    s.created_at = core::from_unix_millis(st.int64(10));
    s.updated_at = core::from_unix_millis(st.int64(11));
    s.scan_queued_at = st.optional_time(12);
    s.scan_completed_at = st.optional_time(13);
    return upl::Ok(std::move(s));
}

nlohmann::json parse_json_column(const std::string& text) {
    auto value = nlohmann::json::parse(text, nullptr, false);
    return value.is_discarded() ? nlohmann::json::object() : value;
}

model::Asset read_asset(const Statement& st) {
    model::Asset a;
    a.id = st.text(0);
    a.session_id = st.text(1);
    a.workspace_id = st.text(2);
    a.container_id = st.optional_text(3);
    a.user_id = st.text(4);
    a.filename = st.text(5);
    a.file_size = static_cast<std::uint64_t>(st.int64(6));
    a.content_type = st.text(7);
    a.metadata = parse_json_column(st.text(8));
    const auto storage = parse_json_column(st.text(9));
    a.storage.backend = storage.value("backend", std::string{});
    a.storage.key = storage.value("key", std::string{});
    a.storage.filename = storage.value("filename", std::string{});
    a.storage.content_type = storage.value("content_type", std::string{});
    a.storage.size = storage.value("size", std::uint64_t{0});
    a.created_at = core::from_unix_millis(st.int64(10));
    return a;
}

} // namespace

upl::Result<std::unique_ptr<SqliteRepository>> SqliteRepository::open(const std::filesystem::path& path) {
    using Ptr = std::unique_ptr<SqliteRepository>;

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec && !std::filesystem::exists(path.parent_path())) {
            return upl::Err<Ptr>(ErrorKind::Storage, "Failed to create directory for " + path.string());
        }
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "sqlite open failed";
        if (db) {
            sqlite3_close(db);
        }
        return upl::Err<Ptr>(ErrorKind::Storage, "Cannot open " + path.string() + ": " + message);
    }

    Ptr repository(new SqliteRepository(db));
    if (auto res = repository->create_schema(); res.is_error()) {
        return upl::Err<Ptr>(res.error());
    }
    spdlog::info("[SqliteRepository] opened {}", path.string());
    return upl::Ok(std::move(repository));
}

SqliteRepository::SqliteRepository(sqlite3* db) : db_(db) {}

SqliteRepository::~SqliteRepository() {
    if (db_) {
        sqlite3_close(db_);
    }
}

upl::Result<void> SqliteRepository::create_schema() {
    // WAL lets the cleanup daemon read while the service writes.
    for (const char* pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA synchronous=NORMAL;", "PRAGMA foreign_keys=ON;"}) {
        if (auto res = exec(db_, pragma); res.is_error()) {
            return res;
        }
    }
    sqlite3_busy_timeout(db_, 5000);
    return exec(db_, kSchema);
}

upl::Result<model::UploadSession> SqliteRepository::load_session_locked(const std::string& session_id) const {
    Statement st(db_, std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE id = ?;");
    if (!st.ok()) {
        return upl::Err<model::UploadSession>(st.error("prepare load session"));
    }
    st.bind(1, session_id);
    const int rc = st.step();
    if (rc == SQLITE_DONE) {
        return upl::Err<model::UploadSession>(ErrorKind::NotFound, "Upload session not found: " + session_id);
    }
    if (rc != SQLITE_ROW) {
        return upl::Err<model::UploadSession>(translate(db_, rc, "load session"));
    }
    return read_session(st);
}

upl::Result<session::SessionEvent> SqliteRepository::insert_event_locked(const std::string& session_id,
                                                                         session::SessionEvent event) {
    Statement next(db_, "SELECT COALESCE(MAX(sequence), 0) + 1 FROM session_events WHERE session_id = ?;");
    if (!next.ok()) {
        return upl::Err<session::SessionEvent>(next.error("prepare event sequence"));
    }
    next.bind(1, session_id);
    if (next.step() != SQLITE_ROW) {
        return upl::Err<session::SessionEvent>(translate(db_, SQLITE_ERROR, "event sequence"));
    }
    event.sequence = static_cast<std::uint64_t>(next.int64(0));

    Statement st(db_,
        "INSERT INTO session_events(session_id, sequence, type, key, payload, status_after, at) "
        "VALUES(?, ?, ?, ?, ?, ?, ?);");
    if (!st.ok()) {
        return upl::Err<session::SessionEvent>(st.error("prepare insert event"));
    }
    st.bind(1, session_id);
    st.bind(2, static_cast<std::int64_t>(event.sequence));
    st.bind(3, event.type);
    st.bind(4, event.key);
    st.bind(5, event.payload.dump());
    st.bind(6, event.status_after ? std::optional<std::string>(model::to_string(*event.status_after))
                                  : std::optional<std::string>{});
    st.bind(7, core::to_unix_millis(event.at));
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return upl::Err<session::SessionEvent>(translate(db_, rc, "insert event"));
    }
    return upl::Ok(std::move(event));
}

upl::Result<model::UploadSession> SqliteRepository::create_session(const model::UploadSession& session,
                                                                   std::vector<session::SessionEvent> initial_events) {
    std::lock_guard lock(mutex_);
    Transaction tx(db_);
    if (auto res = tx.begin(); res.is_error()) {
        return upl::Err<model::UploadSession>(res.error());
    }

    Statement st(db_,
        "INSERT INTO upload_sessions(id, workspace_id, container_id, container_slot, user_id, filename, "
        "total_size, chunks_count, status, assembled_file_path, error_message, created_at, updated_at, "
        "scan_queued_at, scan_completed_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (!st.ok()) {
        return upl::Err<model::UploadSession>(st.error("prepare create session"));
    }
    st.bind(1, session.id);
    st.bind(2, session.workspace_id);
    st.bind(3, session.container_id);
    st.bind(4, container_slot(session.container_id));
    st.bind(5, session.user_id);
    st.bind(6, session.filename);
    st.bind(7, static_cast<std::int64_t>(session.total_size));
    st.bind(8, static_cast<std::int64_t>(session.chunks_count));
    st.bind(9, std::string(model::to_string(session.status)));
    st.bind(10, session.assembled_file_path);
    st.bind(11, session.error_message);
    st.bind(12, core::to_unix_millis(session.created_at));
    st.bind(13, core::to_unix_millis(session.updated_at));
    st.bind(14, session.scan_queued_at);
    st.bind(15, session.scan_completed_at);

    const int rc = st.step();
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        if (sqlite3_extended_errcode(db_) == SQLITE_CONSTRAINT_PRIMARYKEY) {
            return upl::Err<model::UploadSession>(ErrorKind::Conflict, "Session id already exists: " + session.id);
        }
        return upl::Err<model::UploadSession>(ErrorKind::Conflict,
            "An active upload session already exists for " + session.filename);
    }
    if (rc != SQLITE_DONE) {
        return upl::Err<model::UploadSession>(translate(db_, rc, "create session"));
    }

    for (auto& event : initial_events) {
        event.status_after = session.status;
        auto inserted = insert_event_locked(session.id, std::move(event));
        if (inserted.is_error()) {
            return upl::Err<model::UploadSession>(inserted.error());
        }
    }

    if (auto res = tx.commit(); res.is_error()) {
        return upl::Err<model::UploadSession>(res.error());
    }
    return upl::Ok(session);
}

upl::Result<model::UploadSession> SqliteRepository::get_session(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    return load_session_locked(session_id);
}

upl::Result<model::UploadSession> SqliteRepository::apply_transition(const std::string& session_id,
                                                                     const TransitionRequest& request) {
    std::lock_guard lock(mutex_);
    Transaction tx(db_);
    if (auto res = tx.begin(); res.is_error()) {
        return upl::Err<model::UploadSession>(res.error());
    }

    auto current = load_session_locked(session_id);
    if (current.is_error()) {
        return current;
    }
    const auto from = current.value().status;
    if (!status_in(request.expected_from, from)) {
        return upl::Err<model::UploadSession>(ErrorKind::InvalidTransition,
            std::string("Session ") + session_id + " is " + model::to_string(from) +
            ", cannot move to " + model::to_string(request.to));
    }
    if (auto valid = session::validate_transition(from, request.to); valid.is_error()) {
        return upl::Err<model::UploadSession>(valid.error());
    }

    Statement st(db_,
        "UPDATE upload_sessions SET status = ?, updated_at = ?, "
        "assembled_file_path = COALESCE(?, assembled_file_path), "
        "error_message = COALESCE(?, error_message), "
        "scan_queued_at = COALESCE(?, scan_queued_at), "
        "scan_completed_at = COALESCE(?, scan_completed_at) "
        "WHERE id = ? AND status = ?;");
    if (!st.ok()) {
        return upl::Err<model::UploadSession>(st.error("prepare transition"));
    }
    st.bind(1, std::string(model::to_string(request.to)));
    st.bind(2, core::to_unix_millis(request.at));
    st.bind(3, request.assembled_file_path);
    st.bind(4, request.error_message);
    st.bind(5, request.scan_queued_at);
    st.bind(6, request.scan_completed_at);
    st.bind(7, session_id);
    st.bind(8, std::string(model::to_string(from)));
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return upl::Err<model::UploadSession>(translate(db_, rc, "transition"));
    }
    if (sqlite3_changes(db_) != 1) {
        return upl::Err<model::UploadSession>(ErrorKind::InvalidTransition,
            "Session " + session_id + " changed status concurrently");
    }

    for (auto event : request.events) {
        event.status_after = request.to;
        auto inserted = insert_event_locked(session_id, std::move(event));
        if (inserted.is_error()) {
            return upl::Err<model::UploadSession>(inserted.error());
        }
    }

    auto updated = load_session_locked(session_id);
    if (updated.is_error()) {
        return updated;
    }
    if (auto res = tx.commit(); res.is_error()) {
        return upl::Err<model::UploadSession>(res.error());
    }
    return updated;
}

upl::Result<session::SessionEvent> SqliteRepository::append_event(const std::string& session_id,
                                                                  session::SessionEvent event,
                                                                  const std::vector<SessionStatus>& required_status) {
    std::lock_guard lock(mutex_);
    Transaction tx(db_);
    if (auto res = tx.begin(); res.is_error()) {
        return upl::Err<session::SessionEvent>(res.error());
    }

    auto current = load_session_locked(session_id);
    if (current.is_error()) {
        return upl::Err<session::SessionEvent>(current.error());
    }
    const auto status = current.value().status;
    if (!required_status.empty() && !status_in(required_status, status)) {
        return upl::Err<session::SessionEvent>(ErrorKind::InvalidTransition,
            std::string("Session ") + session_id + " is " + model::to_string(status));
    }

    event.status_after = status;
    auto inserted = insert_event_locked(session_id, std::move(event));
    if (inserted.is_error()) {
        return inserted;
    }
    if (auto res = tx.commit(); res.is_error()) {
        return upl::Err<session::SessionEvent>(res.error());
    }
    return inserted;
}

upl::Result<std::vector<session::SessionEvent>> SqliteRepository::events(const std::string& session_id) const {
    using Events = std::vector<session::SessionEvent>;
    std::lock_guard lock(mutex_);

    if (auto exists = load_session_locked(session_id); exists.is_error()) {
        return upl::Err<Events>(exists.error());
    }

    Statement st(db_,
        "SELECT sequence, type, key, payload, status_after, at FROM session_events "
        "WHERE session_id = ? ORDER BY sequence;");
    if (!st.ok()) {
        return upl::Err<Events>(st.error("prepare events"));
    }
    st.bind(1, session_id);

    Events result;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        session::SessionEvent event;
        event.sequence = static_cast<std::uint64_t>(st.int64(0));
        event.type = st.text(1);
        event.key = st.text(2);
        event.payload = parse_json_column(st.text(3));
        if (auto status = st.optional_text(4)) {
            event.status_after = model::parse_session_status(*status);
        }
        event.at = core::from_unix_millis(st.int64(5));
        result.push_back(std::move(event));
    }
    if (rc != SQLITE_DONE) {
        return upl::Err<Events>(translate(db_, rc, "read events"));
    }
    return upl::Ok(std::move(result));
}

upl::Result<void> SqliteRepository::upsert_chunk(const model::Chunk& chunk,
                                                 const std::vector<SessionStatus>& required_status,
                                                 const ChunkCommit& on_accept) {
    std::lock_guard lock(mutex_);
    Transaction tx(db_);
    if (auto res = tx.begin(); res.is_error()) {
        return res;
    }

    auto current = load_session_locked(chunk.session_id);
    if (current.is_error()) {
        return upl::Err<void>(current.error());
    }
    const auto status = current.value().status;
    if (!required_status.empty() && !status_in(required_status, status)) {
        return upl::Err<void>(ErrorKind::InvalidTransition,
            std::string("Session ") + chunk.session_id + " no longer accepts chunks (" +
            model::to_string(status) + ")");
    }

    Statement st(db_,
        "INSERT OR REPLACE INTO upload_chunks(session_id, chunk_number, size, checksum, status, "
        "storage_key, error, updated_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?);");
    if (!st.ok()) {
        return upl::Err<void>(st.error("prepare upsert chunk"));
    }
    st.bind(1, chunk.session_id);
    st.bind(2, static_cast<std::int64_t>(chunk.chunk_number));
    st.bind(3, static_cast<std::int64_t>(chunk.size));
    st.bind(4, chunk.checksum);
    st.bind(5, std::string(model::to_string(chunk.status)));
    st.bind(6, chunk.storage_key);
    st.bind(7, chunk.error);
    st.bind(8, core::to_unix_millis(chunk.updated_at));
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return upl::Err<void>(translate(db_, rc, "upsert chunk"));
    }

    Statement touch(db_, "UPDATE upload_sessions SET updated_at = MAX(updated_at, ?) WHERE id = ?;");
    if (!touch.ok()) {
        return upl::Err<void>(touch.error("prepare touch session"));
    }
    touch.bind(1, core::to_unix_millis(chunk.updated_at));
    touch.bind(2, chunk.session_id);
    if (const int touched = touch.step(); touched != SQLITE_DONE) {
        return upl::Err<void>(translate(db_, touched, "touch session"));
    }

    // Last, so a failed statement above never leaves the bytes swapped in.
    if (on_accept) {
        if (auto accepted = on_accept(); accepted.is_error()) {
            return accepted;
        }
    }
    return tx.commit();
}

upl::Result<std::vector<model::Chunk>> SqliteRepository::list_chunks(const std::string& session_id) const {
    using Chunks = std::vector<model::Chunk>;
    std::lock_guard lock(mutex_);

    if (auto exists = load_session_locked(session_id); exists.is_error()) {
        return upl::Err<Chunks>(exists.error());
    }

    Statement st(db_,
        "SELECT chunk_number, size, checksum, status, storage_key, error, updated_at FROM upload_chunks "
        "WHERE session_id = ? ORDER BY chunk_number;");
    if (!st.ok()) {
        return upl::Err<Chunks>(st.error("prepare list chunks"));
    }
    st.bind(1, session_id);

    Chunks chunks;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        model::Chunk chunk;
        chunk.session_id = session_id;
        chunk.chunk_number = static_cast<std::uint32_t>(st.int64(0));
        chunk.size = static_cast<std::uint64_t>(st.int64(1));
        chunk.checksum = st.text(2);
        chunk.status = model::parse_chunk_status(st.text(3)).value_or(model::ChunkStatus::Failed);
        chunk.storage_key = st.text(4);
        chunk.error = st.text(5);
        chunk.updated_at = core::from_unix_millis(st.int64(6));
        chunks.push_back(std::move(chunk));
    }
    if (rc != SQLITE_DONE) {
        return upl::Err<Chunks>(translate(db_, rc, "list chunks"));
    }
    return upl::Ok(std::move(chunks));
}

upl::Result<std::size_t> SqliteRepository::delete_chunks(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    if (auto exists = load_session_locked(session_id); exists.is_error()) {
        return upl::Err<std::size_t>(exists.error());
    }
    Statement st(db_, "DELETE FROM upload_chunks WHERE session_id = ?;");
    if (!st.ok()) {
        return upl::Err<std::size_t>(st.error("prepare delete chunks"));
    }
    st.bind(1, session_id);
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return upl::Err<std::size_t>(translate(db_, rc, "delete chunks"));
    }
    return upl::Ok(static_cast<std::size_t>(sqlite3_changes(db_)));
}

upl::Result<void> SqliteRepository::remove_session(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    Transaction tx(db_);
    if (auto res = tx.begin(); res.is_error()) {
        return res;
    }

    for (const char* sql : {"DELETE FROM upload_chunks WHERE session_id = ?;",
                            "DELETE FROM session_events WHERE session_id = ?;"}) {
        Statement st(db_, sql);
        if (!st.ok()) {
            return upl::Err<void>(st.error("prepare remove session"));
        }
        st.bind(1, session_id);
        const int rc = st.step();
        if (rc != SQLITE_DONE) {
            return upl::Err<void>(translate(db_, rc, "remove session children"));
        }
    }

    Statement st(db_, "DELETE FROM upload_sessions WHERE id = ?;");
    if (!st.ok()) {
        return upl::Err<void>(st.error("prepare remove session"));
    }
    st.bind(1, session_id);
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return upl::Err<void>(translate(db_, rc, "remove session"));
    }
    if (sqlite3_changes(db_) == 0) {
        return upl::Err<void>(ErrorKind::NotFound, "Upload session not found: " + session_id);
    }
    return tx.commit();
}

upl::Result<std::vector<model::UploadSession>> SqliteRepository::find_sessions(const SessionQuery& query) const {
    using Sessions = std::vector<model::UploadSession>;

    std::string sql = std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE 1 = 1";
    if (!query.statuses.empty()) {
        sql += " AND status IN (" + status_list(query.statuses) + ")";
    }
    if (query.workspace_id) {
        sql += " AND workspace_id = ?";
    }
    if (query.updated_before) {
        sql += " AND updated_at < ?";
    }
    if (query.order == SessionQuery::Order::ById) {
        if (query.after_id) {
            sql += " AND id > ?";
        }
        sql += " ORDER BY id ASC";
    } else {
        sql += " ORDER BY created_at DESC, id DESC";
    }
    sql += " LIMIT ?;";

    std::lock_guard lock(mutex_);
    Statement st(db_, sql);
    if (!st.ok()) {
        return upl::Err<Sessions>(st.error("prepare find sessions"));
    }

    int idx = 1;
    for (const auto status : query.statuses) {
        st.bind(idx++, std::string(model::to_string(status)));
    }
    if (query.workspace_id) {
        st.bind(idx++, *query.workspace_id);
    }
    if (query.updated_before) {
        st.bind(idx++, core::to_unix_millis(*query.updated_before));
    }
    if (query.order == SessionQuery::Order::ById && query.after_id) {
        st.bind(idx++, *query.after_id);
    }
    st.bind(idx, static_cast<std::int64_t>(query.limit));

    Sessions result;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        auto session = read_session(st);
        if (session.is_error()) {
            return upl::Err<Sessions>(session.error());
        }
        result.push_back(std::move(session.value()));
    }
    if (rc != SQLITE_DONE) {
        return upl::Err<Sessions>(translate(db_, rc, "find sessions"));
    }
    return upl::Ok(std::move(result));
}

upl::Result<model::Asset> SqliteRepository::insert_asset_once(const model::Asset& asset) {
    std::lock_guard lock(mutex_);
    Transaction tx(db_);
    if (auto res = tx.begin(); res.is_error()) {
        return upl::Err<model::Asset>(res.error());
    }

    {
        Statement existing(db_, std::string("SELECT ") + kAssetColumns + " FROM assets WHERE session_id = ?;");
        if (!existing.ok()) {
            return upl::Err<model::Asset>(existing.error("prepare find asset"));
        }
        existing.bind(1, asset.session_id);
        const int rc = existing.step();
        if (rc == SQLITE_ROW) {
            return upl::Ok(read_asset(existing));
        }
        if (rc != SQLITE_DONE) {
            return upl::Err<model::Asset>(translate(db_, rc, "find asset"));
        }
    }

    Statement st(db_, std::string("INSERT INTO assets(") + kAssetColumns +
                      ") VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (!st.ok()) {
        return upl::Err<model::Asset>(st.error("prepare insert asset"));
    }
    st.bind(1, asset.id);
    st.bind(2, asset.session_id);
    st.bind(3, asset.workspace_id);
    st.bind(4, asset.container_id);
    st.bind(5, asset.user_id);
    st.bind(6, asset.filename);
    st.bind(7, static_cast<std::int64_t>(asset.file_size));
    st.bind(8, asset.content_type);
    st.bind(9, asset.metadata.dump());
    st.bind(10, model::to_json(asset.storage).dump());
    st.bind(11, core::to_unix_millis(asset.created_at));
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return upl::Err<model::Asset>(translate(db_, rc, "insert asset"));
    }
    if (auto res = tx.commit(); res.is_error()) {
        return upl::Err<model::Asset>(res.error());
    }
    return upl::Ok(asset);
}

upl::Result<std::optional<model::Asset>> SqliteRepository::find_asset_by_session(const std::string& session_id) const {
    using Found = std::optional<model::Asset>;
    std::lock_guard lock(mutex_);
    Statement st(db_, std::string("SELECT ") + kAssetColumns + " FROM assets WHERE session_id = ?;");
    if (!st.ok()) {
        return upl::Err<Found>(st.error("prepare find asset"));
    }
    st.bind(1, session_id);
    const int rc = st.step();
    if (rc == SQLITE_ROW) {
        return upl::Ok(Found(read_asset(st)));
    }
    if (rc != SQLITE_DONE) {
        return upl::Err<Found>(translate(db_, rc, "find asset"));
    }
    return upl::Ok(Found{});
}

upl::Result<model::Asset> SqliteRepository::get_asset(const std::string& asset_id) const {
    std::lock_guard lock(mutex_);
    Statement st(db_, std::string("SELECT ") + kAssetColumns + " FROM assets WHERE id = ?;");
    if (!st.ok()) {
        return upl::Err<model::Asset>(st.error("prepare get asset"));
    }
    st.bind(1, asset_id);
    const int rc = st.step();
    if (rc == SQLITE_ROW) {
        return upl::Ok(read_asset(st));
    }
    if (rc != SQLITE_DONE) {
        return upl::Err<model::Asset>(translate(db_, rc, "get asset"));
    }
    return upl::Err<model::Asset>(ErrorKind::NotFound, "Asset not found: " + asset_id);
}

upl::Result<std::vector<model::Asset>> SqliteRepository::list_assets(const std::string& workspace_id) const {
    using Assets = std::vector<model::Asset>;
    std::lock_guard lock(mutex_);
    Statement st(db_, std::string("SELECT ") + kAssetColumns +
                      " FROM assets WHERE workspace_id = ? ORDER BY created_at, id;");
    if (!st.ok()) {
        return upl::Err<Assets>(st.error("prepare list assets"));
    }
    st.bind(1, workspace_id);

    Assets result;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        result.push_back(read_asset(st));
    }
    if (rc != SQLITE_DONE) {
        return upl::Err<Assets>(translate(db_, rc, "list assets"));
    }
    return upl::Ok(std::move(result));
}

} // namespace upl::storage
