#include "vault/persistence/database.hpp"

#include <spdlog/spdlog.h>

namespace vault::persistence {
namespace {

void throw_if(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        throw DatabaseError(std::string(what) + ": " + sqlite3_errmsg(db), sqlite3_extended_errcode(db));
    }
}

} // namespace

// ──────────────────────────────────────────────────────────
// Database
// ──────────────────────────────────────────────────────────

Database::Database(std::string path)
    : path_(std::move(path)) {
    const int rc = sqlite3_open_v2(path_.c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        throw DatabaseError("open " + path_ + ": " + msg, rc);
    }

    configure();
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw DatabaseError(msg, rc);
    }
}

std::int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::configure() {
    // In-memory databases report "memory" and ignore WAL
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    exec("PRAGMA foreign_keys=ON;");
    throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
    exec("PRAGMA temp_store=MEMORY;");
}

// ──────────────────────────────────────────────────────────
// Statement
// ──────────────────────────────────────────────────────────

Statement::Statement(Database& db, const std::string& sql)
    : db_(db) {
    check(sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr), "sqlite prepare");
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement& Statement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
          "sqlite bind text");
    return *this;
}

Statement& Statement::bind(int index, const char* value) {
    return bind(index, std::string(value));
}

Statement& Statement::bind(int index, std::int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), "sqlite bind int64");
    return *this;
}

Statement& Statement::bind(int index, int value) {
    return bind(index, static_cast<std::int64_t>(value));
}

Statement& Statement::bind(int index, double value) {
    check(sqlite3_bind_double(stmt_, index, value), "sqlite bind double");
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind(int index, const std::optional<double>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind_null(int index) {
    check(sqlite3_bind_null(stmt_, index), "sqlite bind null");
    return *this;
}

bool Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw DatabaseError(std::string("sqlite step: ") + sqlite3_errmsg(db_.handle()),
                        sqlite3_extended_errcode(db_.handle()));
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

bool Statement::is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::string Statement::column_text(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<std::string> Statement::column_optional_text(int column) const {
    if (is_null(column)) {
        return std::nullopt;
    }
    return column_text(column);
}

std::int64_t Statement::column_int64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

double Statement::column_double(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::optional<double> Statement::column_optional_double(int column) const {
    if (is_null(column)) {
        return std::nullopt;
    }
    return column_double(column);
}

void Statement::check(int rc, const char* what) const {
    throw_if(rc, db_.handle(), what);
}

// ──────────────────────────────────────────────────────────
// Transaction
// ──────────────────────────────────────────────────────────

Transaction::Transaction(Database& db)
    : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) {
        return;
    }
    try {
        db_.exec("ROLLBACK;");
    } catch (const DatabaseError& e) {
        spdlog::error("Rollback failed on {}: {}", db_.path(), e.what());
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace vault::persistence
