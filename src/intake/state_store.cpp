#include "vault/intake/state_store.hpp"

namespace vault::intake {

using model::ManifestFile;
using model::PendingBatch;
using model::UploadSession;
using persistence::Statement;
using persistence::guarded;

// ──────────────────────────────────────────────────────────
// MemoryIntakeStore
// ──────────────────────────────────────────────────────────

Result<void> MemoryIntakeStore::put_session(const UploadSession& session) {
    std::lock_guard lock(mutex_);
    sessions_[session.session_id] = session;
    return Ok();
}

Result<std::optional<UploadSession>> MemoryIntakeStore::get_session(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Ok(std::optional<UploadSession>{});
    }
    return Ok(std::optional<UploadSession>{it->second});
}

Result<void> MemoryIntakeStore::erase_session(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    sessions_.erase(session_id);
    return Ok();
}

Result<std::vector<UploadSession>> MemoryIntakeStore::list_sessions() {
    std::lock_guard lock(mutex_);
    std::vector<UploadSession> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        sessions.push_back(session);
    }
    return Ok(sessions);
}

Result<std::size_t> MemoryIntakeStore::session_count() {
    std::lock_guard lock(mutex_);
    return Ok(sessions_.size());
}

Result<void> MemoryIntakeStore::create_batch(const PendingBatch& batch) {
    std::lock_guard lock(mutex_);
    if (!batches_.emplace(batch.batch_id, batch).second) {
        return fail<void>(ErrorCode::AlreadyExists, "batch " + batch.batch_id + " exists");
    }
    return Ok();
}

Result<std::optional<PendingBatch>> MemoryIntakeStore::get_batch(const std::string& batch_id) {
    std::lock_guard lock(mutex_);
    auto it = batches_.find(batch_id);
    if (it == batches_.end()) {
        return Ok(std::optional<PendingBatch>{});
    }
    return Ok(std::optional<PendingBatch>{it->second});
}

Result<void> MemoryIntakeStore::append_batch_file(const std::string& batch_id, const ManifestFile& file) {
    std::lock_guard lock(mutex_);
    auto it = batches_.find(batch_id);
    if (it == batches_.end()) {
        return fail<void>(ErrorCode::UnknownBatch, "no batch " + batch_id);
    }
    if (it->second.finalized) {
        return fail<void>(ErrorCode::BatchFinalized, "batch " + batch_id + " is finalized");
    }
    it->second.files.push_back(file);
    return Ok();
}

Result<bool> MemoryIntakeStore::finalize_batch(const std::string& batch_id) {
    std::lock_guard lock(mutex_);
    auto it = batches_.find(batch_id);
    if (it == batches_.end()) {
        return fail<bool>(ErrorCode::UnknownBatch, "no batch " + batch_id);
    }
    if (it->second.finalized) {
        return Ok(false);
    }
    it->second.finalized = true;
    return Ok(true);
}

// ──────────────────────────────────────────────────────────
// SqliteIntakeStore
// ──────────────────────────────────────────────────────────

namespace {

constexpr const char* kIntakeSchema = R"sql(
CREATE TABLE IF NOT EXISTS upload_sessions (
    session_id        TEXT PRIMARY KEY,
    remote_handle     TEXT NOT NULL,
    contributor_token TEXT NOT NULL,
    filename          TEXT NOT NULL,
    mime_type         TEXT NOT NULL DEFAULT '',
    total_bytes       INTEGER NOT NULL,
    committed_offset  INTEGER NOT NULL DEFAULT 0,
    batch_id          TEXT NOT NULL DEFAULT '',
    created_at        INTEGER NOT NULL,
    updated_at        INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS pending_batches (
    batch_id          TEXT PRIMARY KEY,
    contributor_token TEXT NOT NULL,
    created_at        INTEGER NOT NULL,
    finalized         INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS batch_files (
    seq            INTEGER PRIMARY KEY AUTOINCREMENT,
    batch_id       TEXT NOT NULL REFERENCES pending_batches(batch_id),
    origin_file_id TEXT NOT NULL,
    original_name  TEXT NOT NULL,
    size_bytes     INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_batch_files_batch ON batch_files(batch_id);
)sql";

constexpr const char* kSessionColumns =
    "session_id, remote_handle, contributor_token, filename, mime_type, total_bytes, "
    "committed_offset, batch_id, created_at, updated_at";

UploadSession read_session(const Statement& stmt) {
    UploadSession session;
    session.session_id = stmt.column_text(0);
    session.remote_handle = stmt.column_text(1);
    session.contributor_token = stmt.column_text(2);
    session.filename = stmt.column_text(3);
    session.mime_type = stmt.column_text(4);
    session.total_bytes = static_cast<std::uint64_t>(stmt.column_int64(5));
    session.committed_offset = static_cast<std::uint64_t>(stmt.column_int64(6));
    session.batch_id = stmt.column_text(7);
    session.created_at = static_cast<std::time_t>(stmt.column_int64(8));
    session.updated_at = static_cast<std::time_t>(stmt.column_int64(9));
    return session;
}

} // namespace

SqliteIntakeStore::SqliteIntakeStore(persistence::Database& db)
    : db_(db) {
}

Result<void> SqliteIntakeStore::migrate() {
    return guarded<void>(db_, "migrate intake", [&]() -> Result<void> {
        db_.exec(kIntakeSchema);
        return Ok();
    });
}

Result<void> SqliteIntakeStore::put_session(const UploadSession& session) {
    return guarded<void>(db_, "put session", [&]() -> Result<void> {
        Statement stmt(db_, std::string("INSERT OR REPLACE INTO upload_sessions (") + kSessionColumns +
                                ") VALUES (?,?,?,?,?,?,?,?,?,?)");
        stmt.bind(1, session.session_id)
            .bind(2, session.remote_handle)
            .bind(3, session.contributor_token)
            .bind(4, session.filename)
            .bind(5, session.mime_type)
            .bind(6, static_cast<std::int64_t>(session.total_bytes))
            .bind(7, static_cast<std::int64_t>(session.committed_offset))
            .bind(8, session.batch_id)
            .bind(9, static_cast<std::int64_t>(session.created_at))
            .bind(10, static_cast<std::int64_t>(session.updated_at));
        stmt.step();
        return Ok();
    });
}

Result<std::optional<UploadSession>> SqliteIntakeStore::get_session(const std::string& session_id) {
    using Found = std::optional<UploadSession>;
    return guarded<Found>(db_, "get session", [&]() -> Result<Found> {
        Statement stmt(db_, std::string("SELECT ") + kSessionColumns +
                                " FROM upload_sessions WHERE session_id = ?");
        stmt.bind(1, session_id);
        if (!stmt.step()) {
            return Ok(Found{});
        }
        return Ok(Found{read_session(stmt)});
    });
}

Result<void> SqliteIntakeStore::erase_session(const std::string& session_id) {
    return guarded<void>(db_, "erase session", [&]() -> Result<void> {
        Statement stmt(db_, "DELETE FROM upload_sessions WHERE session_id = ?");
        stmt.bind(1, session_id);
        stmt.step();
        return Ok();
    });
}

Result<std::vector<UploadSession>> SqliteIntakeStore::list_sessions() {
    using Sessions = std::vector<UploadSession>;
    return guarded<Sessions>(db_, "list sessions", [&]() -> Result<Sessions> {
        Statement stmt(db_, std::string("SELECT ") + kSessionColumns +
                                " FROM upload_sessions ORDER BY created_at, session_id");
        Sessions sessions;
        while (stmt.step()) {
            sessions.push_back(read_session(stmt));
        }
        return Ok(sessions);
    });
}

Result<std::size_t> SqliteIntakeStore::session_count() {
    return guarded<std::size_t>(db_, "count sessions", [&]() -> Result<std::size_t> {
        Statement stmt(db_, "SELECT COUNT(*) FROM upload_sessions");
        stmt.step();
        return Ok(static_cast<std::size_t>(stmt.column_int64(0)));
    });
}

Result<void> SqliteIntakeStore::create_batch(const PendingBatch& batch) {
    return guarded<void>(db_, "create batch", [&]() -> Result<void> {
        Statement stmt(db_,
            "INSERT OR IGNORE INTO pending_batches (batch_id, contributor_token, created_at, finalized) "
            "VALUES (?,?,?,?)");
        stmt.bind(1, batch.batch_id)
            .bind(2, batch.contributor_token)
            .bind(3, static_cast<std::int64_t>(batch.created_at))
            .bind(4, batch.finalized ? 1 : 0);
        stmt.step();
        if (db_.changes() == 0) {
            return fail<void>(ErrorCode::AlreadyExists, "batch " + batch.batch_id + " exists");
        }
        return Ok();
    });
}

Result<std::optional<PendingBatch>> SqliteIntakeStore::get_batch(const std::string& batch_id) {
    using Found = std::optional<PendingBatch>;
    return guarded<Found>(db_, "get batch", [&]() -> Result<Found> {
        Statement stmt(db_,
            "SELECT batch_id, contributor_token, created_at, finalized FROM pending_batches WHERE batch_id = ?");
        stmt.bind(1, batch_id);
        if (!stmt.step()) {
            return Ok(Found{});
        }
        PendingBatch batch;
        batch.batch_id = stmt.column_text(0);
        batch.contributor_token = stmt.column_text(1);
        batch.created_at = static_cast<std::time_t>(stmt.column_int64(2));
        batch.finalized = stmt.column_int64(3) != 0;

        Statement files(db_,
            "SELECT origin_file_id, original_name, size_bytes FROM batch_files WHERE batch_id = ? ORDER BY seq");
        files.bind(1, batch_id);
        while (files.step()) {
            ManifestFile file;
            file.origin_file_id = files.column_text(0);
            file.original_name = files.column_text(1);
            file.size_bytes = static_cast<std::uint64_t>(files.column_int64(2));
            batch.files.push_back(std::move(file));
        }
        return Ok(Found{batch});
    });
}

Result<void> SqliteIntakeStore::append_batch_file(const std::string& batch_id, const ManifestFile& file) {
    return guarded<void>(db_, "append batch file", [&]() -> Result<void> {
        persistence::Transaction tx(db_);

        Statement check(db_, "SELECT finalized FROM pending_batches WHERE batch_id = ?");
        check.bind(1, batch_id);
        if (!check.step()) {
            return fail<void>(ErrorCode::UnknownBatch, "no batch " + batch_id);
        }
        if (check.column_int64(0) != 0) {
            return fail<void>(ErrorCode::BatchFinalized, "batch " + batch_id + " is finalized");
        }
        check.reset();

        Statement insert(db_,
            "INSERT INTO batch_files (batch_id, origin_file_id, original_name, size_bytes) VALUES (?,?,?,?)");
        insert.bind(1, batch_id)
            .bind(2, file.origin_file_id)
            .bind(3, file.original_name)
            .bind(4, static_cast<std::int64_t>(file.size_bytes));
        insert.step();
        tx.commit();
        return Ok();
    });
}

Result<bool> SqliteIntakeStore::finalize_batch(const std::string& batch_id) {
    return guarded<bool>(db_, "finalize batch", [&]() -> Result<bool> {
        Statement update(db_, "UPDATE pending_batches SET finalized = 1 WHERE batch_id = ? AND finalized = 0");
        update.bind(1, batch_id);
        update.step();
        if (db_.changes() > 0) {
            return Ok(true);
        }

        Statement exists(db_, "SELECT 1 FROM pending_batches WHERE batch_id = ?");
        exists.bind(1, batch_id);
        if (!exists.step()) {
            return fail<bool>(ErrorCode::UnknownBatch, "no batch " + batch_id);
        }
        return Ok(false);
    });
}

} // namespace vault::intake
