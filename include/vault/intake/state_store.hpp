#pragma once

/**
 * @file state_store.hpp
 * @brief Intake-side state: open upload sessions and pending batches
 *
 * WHY THIS FILE EXISTS:
 * Upload sessions must survive a server restart, or a client resuming
 * after a crash would find its session gone. The manager receives the
 * store by reference so tests run against the in-memory version and the
 * server against SQLite.
 *
 * All implementations are safe to call from every HTTP thread.
 */

#include "vault/core/result.hpp"
#include "vault/model/types.hpp"
#include "vault/persistence/database.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vault::intake {

class IntakeStateStore {
public:
    virtual ~IntakeStateStore() = default;

    /// Insert or replace a session.
    virtual Result<void> put_session(const model::UploadSession& session) = 0;
    virtual Result<std::optional<model::UploadSession>> get_session(const std::string& session_id) = 0;
    virtual Result<void> erase_session(const std::string& session_id) = 0;
    virtual Result<std::vector<model::UploadSession>> list_sessions() = 0;
    virtual Result<std::size_t> session_count() = 0;

    /// Insert a new batch; AlreadyExists if the id is taken.
    virtual Result<void> create_batch(const model::PendingBatch& batch) = 0;
    virtual Result<std::optional<model::PendingBatch>> get_batch(const std::string& batch_id) = 0;

    /**
     * @brief Record a completed upload in its batch
     *
     * UnknownBatch when missing, BatchFinalized once the manifest is out.
     */
    virtual Result<void> append_batch_file(const std::string& batch_id, const model::ManifestFile& file) = 0;

    /// Mark finalized. Returns false when it already was.
    virtual Result<bool> finalize_batch(const std::string& batch_id) = 0;
};

class MemoryIntakeStore : public IntakeStateStore {
public:
    Result<void> put_session(const model::UploadSession& session) override;
    Result<std::optional<model::UploadSession>> get_session(const std::string& session_id) override;
    Result<void> erase_session(const std::string& session_id) override;
    Result<std::vector<model::UploadSession>> list_sessions() override;
    Result<std::size_t> session_count() override;

    Result<void> create_batch(const model::PendingBatch& batch) override;
    Result<std::optional<model::PendingBatch>> get_batch(const std::string& batch_id) override;
    Result<void> append_batch_file(const std::string& batch_id, const model::ManifestFile& file) override;
    Result<bool> finalize_batch(const std::string& batch_id) override;

private:
    std::mutex mutex_;
    std::map<std::string, model::UploadSession> sessions_;
    std::map<std::string, model::PendingBatch> batches_;
};

/**
 * @brief IntakeStateStore on SQLite
 *
 * Tables upload_sessions, pending_batches and batch_files. Batch files keep
 * their upload order through an autoincrement key.
 */
class SqliteIntakeStore : public IntakeStateStore {
public:
    explicit SqliteIntakeStore(persistence::Database& db);

    Result<void> migrate();

    Result<void> put_session(const model::UploadSession& session) override;
    Result<std::optional<model::UploadSession>> get_session(const std::string& session_id) override;
    Result<void> erase_session(const std::string& session_id) override;
    Result<std::vector<model::UploadSession>> list_sessions() override;
    Result<std::size_t> session_count() override;

    Result<void> create_batch(const model::PendingBatch& batch) override;
    Result<std::optional<model::PendingBatch>> get_batch(const std::string& batch_id) override;
    Result<void> append_batch_file(const std::string& batch_id, const model::ManifestFile& file) override;
    Result<bool> finalize_batch(const std::string& batch_id) override;

private:
    persistence::Database& db_;
};

} // namespace vault::intake
