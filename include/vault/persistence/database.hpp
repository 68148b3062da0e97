#pragma once

#include "vault/core/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace vault::persistence {

/**
 * @brief SQLite failure, carrying the extended result code
 *
 * Only the wrapper throws; repositories convert to Result at their
 * public boundary.
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(const std::string& what, int code)
        : std::runtime_error(what), code_(code) {}

    int code() const { return code_; }
    bool is_constraint() const { return (code_ & 0xff) == SQLITE_CONSTRAINT; }

private:
    int code_;
};

/**
 * @brief Thin RAII wrapper around sqlite3*
 *
 * Opens in WAL mode with a 5 s busy timeout. Callers serialize
 * multi-statement work through mutex().
 */
class Database {
public:
    explicit Database(std::string path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    /// Execute one or more statements without results (pragmas, DDL).
    void exec(const std::string& sql);

    std::int64_t last_insert_rowid() const;
    int changes() const;

    std::recursive_mutex& mutex() { return mutex_; }

private:
    void configure();

    sqlite3* db_ = nullptr;
    std::string path_;
    std::recursive_mutex mutex_;
};

/**
 * @brief Prepared statement, finalized on destruction
 *
 * Bind indexes are 1-based, column indexes 0-based, as in the C API.
 */
class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, int value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::optional<std::string>& value);
    Statement& bind(int index, const std::optional<double>& value);
    Statement& bind_null(int index);

    /// Advance; true when a row is available, false when done.
    bool step();

    void reset();

    bool is_null(int column) const;
    std::string column_text(int column) const;
    std::optional<std::string> column_optional_text(int column) const;
    std::int64_t column_int64(int column) const;
    double column_double(int column) const;
    std::optional<double> column_optional_double(int column) const;

private:
    void check(int rc, const char* what) const;

    Database& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief BEGIN IMMEDIATE ... COMMIT, rolled back unless commit() ran
 */
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

/**
 * @brief Run @p fn under the database lock, turning DatabaseError into Storage
 *
 * @code
 * return guarded<bool>(db_, "claim asset", [&]() -> Result<bool> { ... });
 * @endcode
 */
template<typename T, typename Fn>
Result<T> guarded(Database& db, const char* what, Fn&& fn) {
    std::lock_guard lock(db.mutex());
    try {
        return fn();
    } catch (const DatabaseError& e) {
        return Err<T>(Error(ErrorCode::Storage, std::string(what) + ": " + e.what()));
    }
}

} // namespace vault::persistence
