#include "vault/persistence/asset_repository.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace vault::persistence {

using model::Asset;
using model::AssetStatus;

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS assets (
    asset_id          TEXT PRIMARY KEY,
    origin_file_id    TEXT NOT NULL UNIQUE,
    contributor_token TEXT NOT NULL DEFAULT '',
    batch_id          TEXT NOT NULL DEFAULT '',
    original_filename TEXT NOT NULL DEFAULT '',
    mime_type         TEXT NOT NULL DEFAULT '',
    size_bytes        INTEGER NOT NULL DEFAULT 0,
    sha256            TEXT NOT NULL DEFAULT '',
    phash             TEXT,
    status            TEXT NOT NULL,
    duplicate_of      TEXT,
    duplicate_method  TEXT,
    decade_estimate   TEXT,
    event             TEXT,
    notes             TEXT,
    caption           TEXT,
    faces_count       INTEGER NOT NULL DEFAULT 0,
    embedding_ref     TEXT,
    transcript_ref    TEXT,
    duration_seconds  REAL,
    attempts          INTEGER NOT NULL DEFAULT 0,
    last_error        TEXT NOT NULL DEFAULT '',
    created_at        INTEGER NOT NULL,
    processed_at      INTEGER NOT NULL DEFAULT 0,
    exif_date         TEXT,
    decade_confidence REAL,
    gps_lat           REAL,
    gps_lon           REAL
);
CREATE INDEX IF NOT EXISTS idx_assets_sha256 ON assets(sha256);
CREATE INDEX IF NOT EXISTS idx_assets_status ON assets(status);
CREATE INDEX IF NOT EXISTS idx_assets_phash ON assets(phash) WHERE phash IS NOT NULL;

CREATE TABLE IF NOT EXISTS duplicates (
    asset_id     TEXT NOT NULL REFERENCES assets(asset_id),
    duplicate_of TEXT NOT NULL REFERENCES assets(asset_id),
    method       TEXT NOT NULL,
    distance     INTEGER NOT NULL DEFAULT 0,
    created_at   INTEGER NOT NULL,
    PRIMARY KEY (asset_id, duplicate_of)
);

CREATE TABLE IF NOT EXISTS batches (
    batch_id          TEXT PRIMARY KEY,
    contributor_token TEXT NOT NULL DEFAULT '',
    created_at        INTEGER NOT NULL,
    decade            TEXT,
    event             TEXT,
    notes             TEXT,
    manifest_id       TEXT NOT NULL UNIQUE
);

CREATE TABLE IF NOT EXISTS processing_log (
    id         INTEGER PRIMARY KEY AUTOINCREMENT,
    asset_id   TEXT NOT NULL,
    step       TEXT NOT NULL,
    status     TEXT NOT NULL,
    details    TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_log_asset ON processing_log(asset_id);

CREATE TABLE IF NOT EXISTS ops_state (
    key        TEXT PRIMARY KEY,
    value      TEXT NOT NULL,
    updated_at INTEGER NOT NULL
);
)sql";

// Columns added after the first release, with their declarations
struct AddedColumn {
    const char* name;
    const char* declaration;
};

constexpr AddedColumn kAddedAssetColumns[] = {
    {"exif_date", "TEXT"},
    {"decade_confidence", "REAL"},
    {"gps_lat", "REAL"},
    {"gps_lon", "REAL"},
};

constexpr const char* kAssetColumns =
    "asset_id, origin_file_id, contributor_token, batch_id, original_filename, mime_type, "
    "size_bytes, sha256, phash, status, duplicate_of, duplicate_method, decade_estimate, "
    "event, notes, caption, faces_count, embedding_ref, transcript_ref, duration_seconds, "
    "attempts, last_error, created_at, processed_at, exif_date, decade_confidence, gps_lat, gps_lon";

void bind_asset(Statement& stmt, const Asset& a) {
    stmt.bind(1, a.asset_id)
        .bind(2, a.origin_file_id)
        .bind(3, a.contributor_token)
        .bind(4, a.batch_id)
        .bind(5, a.original_filename)
        .bind(6, a.mime_type)
        .bind(7, static_cast<std::int64_t>(a.size_bytes))
        .bind(8, a.sha256)
        .bind(9, a.phash)
        .bind(10, model::to_string(a.status))
        .bind(11, a.duplicate_of);
    if (a.duplicate_method) {
        stmt.bind(12, model::to_string(*a.duplicate_method));
    } else {
        stmt.bind_null(12);
    }
    stmt.bind(13, a.decade_estimate)
        .bind(14, a.event)
        .bind(15, a.notes)
        .bind(16, a.caption)
        .bind(17, static_cast<std::int64_t>(a.faces_count))
        .bind(18, a.embedding_ref)
        .bind(19, a.transcript_ref)
        .bind(20, a.duration_seconds)
        .bind(21, a.attempts)
        .bind(22, a.last_error)
        .bind(23, static_cast<std::int64_t>(a.created_at))
        .bind(24, static_cast<std::int64_t>(a.processed_at))
        .bind(25, a.exif_date)
        .bind(26, a.decade_confidence)
        .bind(27, a.gps_lat)
        .bind(28, a.gps_lon);
}

Asset read_asset(const Statement& stmt) {
    Asset a;
    a.asset_id = stmt.column_text(0);
    a.origin_file_id = stmt.column_text(1);
    a.contributor_token = stmt.column_text(2);
    a.batch_id = stmt.column_text(3);
    a.original_filename = stmt.column_text(4);
    a.mime_type = stmt.column_text(5);
    a.size_bytes = static_cast<std::uint64_t>(stmt.column_int64(6));
    a.sha256 = stmt.column_text(7);
    a.phash = stmt.column_optional_text(8);

    const std::string status = stmt.column_text(9);
    if (auto parsed = model::status_from_string(status)) {
        a.status = *parsed;
    } else {
        spdlog::warn("Asset {} has unknown status '{}', treating as error", a.asset_id, status);
        a.status = AssetStatus::Error;
    }

    a.duplicate_of = stmt.column_optional_text(10);
    if (auto method = stmt.column_optional_text(11)) {
        a.duplicate_method = model::duplicate_method_from_string(*method);
    }
    a.decade_estimate = stmt.column_optional_text(12);
    a.event = stmt.column_optional_text(13);
    a.notes = stmt.column_optional_text(14);
    a.caption = stmt.column_optional_text(15);
    a.faces_count = static_cast<std::size_t>(stmt.column_int64(16));
    a.embedding_ref = stmt.column_optional_text(17);
    a.transcript_ref = stmt.column_optional_text(18);
    a.duration_seconds = stmt.column_optional_double(19);
    a.attempts = static_cast<int>(stmt.column_int64(20));
    a.last_error = stmt.column_text(21);
    a.created_at = static_cast<std::time_t>(stmt.column_int64(22));
    a.processed_at = static_cast<std::time_t>(stmt.column_int64(23));
    a.exif_date = stmt.column_optional_text(24);
    a.decade_confidence = stmt.column_optional_double(25);
    a.gps_lat = stmt.column_optional_double(26);
    a.gps_lon = stmt.column_optional_double(27);
    return a;
}

pipeline::FingerprintRecord read_fingerprint(const Statement& stmt) {
    pipeline::FingerprintRecord record;
    record.asset_id = stmt.column_text(0);
    record.sha256 = stmt.column_text(1);
    record.phash = stmt.column_optional_text(2);
    record.status = model::status_from_string(stmt.column_text(3)).value_or(AssetStatus::Error);
    record.created_at = static_cast<std::time_t>(stmt.column_int64(4));
    record.claim_order = stmt.column_int64(5);
    return record;
}

std::int64_t now() {
    return static_cast<std::int64_t>(std::time(nullptr));
}

} // namespace

AssetRepository::AssetRepository(Database& db)
    : db_(db) {
}

Result<void> AssetRepository::migrate() {
    return guarded<void>(db_, "migrate", [&]() -> Result<void> {
        db_.exec(kSchema);

        std::set<std::string> present;
        {
            Statement columns(db_, "PRAGMA table_info(assets)");
            while (columns.step()) {
                present.insert(columns.column_text(1));
            }
        }
        for (const auto& column : kAddedAssetColumns) {
            if (present.count(column.name) == 0) {
                spdlog::info("Adding column assets.{}", column.name);
                db_.exec(std::string("ALTER TABLE assets ADD COLUMN ") + column.name + " " + column.declaration);
            }
        }
        return Ok();
    });
}

Result<bool> AssetRepository::claim(const Asset& asset) {
    return guarded<bool>(db_, "claim asset", [&]() -> Result<bool> {
        Statement stmt(db_, std::string("INSERT OR IGNORE INTO assets (") + kAssetColumns +
                                ") VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)");
        bind_asset(stmt, asset);
        stmt.step();
        return Ok(db_.changes() > 0);
    });
}

Result<void> AssetRepository::update(const Asset& asset) {
    return guarded<void>(db_, "update asset", [&]() -> Result<void> {
        write_asset(asset);
        return Ok();
    });
}

Result<void> AssetRepository::record_outcome(const Asset& asset,
                                             const std::optional<model::DuplicateLink>& link) {
    return guarded<void>(db_, "record outcome", [&]() -> Result<void> {
        Transaction tx(db_);
        write_asset(asset);
        if (link) {
            Statement stmt(db_,
                "INSERT OR IGNORE INTO duplicates (asset_id, duplicate_of, method, distance, created_at) "
                "VALUES (?,?,?,?,?)");
            stmt.bind(1, link->asset_id)
                .bind(2, link->duplicate_of)
                .bind(3, model::to_string(link->method))
                .bind(4, link->distance)
                .bind(5, static_cast<std::int64_t>(link->created_at));
            stmt.step();
        }
        tx.commit();
        return Ok();
    });
}

Result<std::optional<Asset>> AssetRepository::find(const std::string& asset_id) const {
    return guarded<std::optional<Asset>>(db_, "find asset", [&]() -> Result<std::optional<Asset>> {
        Statement stmt(db_, std::string("SELECT ") + kAssetColumns + " FROM assets WHERE asset_id = ?");
        stmt.bind(1, asset_id);
        if (!stmt.step()) {
            return Ok(std::optional<Asset>{});
        }
        return Ok(std::optional<Asset>{read_asset(stmt)});
    });
}

Result<std::optional<Asset>> AssetRepository::find_by_origin(const std::string& origin_file_id) const {
    return guarded<std::optional<Asset>>(db_, "find asset by origin", [&]() -> Result<std::optional<Asset>> {
        Statement stmt(db_, std::string("SELECT ") + kAssetColumns + " FROM assets WHERE origin_file_id = ?");
        stmt.bind(1, origin_file_id);
        if (!stmt.step()) {
            return Ok(std::optional<Asset>{});
        }
        return Ok(std::optional<Asset>{read_asset(stmt)});
    });
}

Result<std::vector<Asset>> AssetRepository::list_by_status(AssetStatus status) const {
    return guarded<std::vector<Asset>>(db_, "list assets", [&]() -> Result<std::vector<Asset>> {
        Statement stmt(db_, std::string("SELECT ") + kAssetColumns +
                                " FROM assets WHERE status = ? ORDER BY created_at, asset_id");
        stmt.bind(1, model::to_string(status));
        std::vector<Asset> assets;
        while (stmt.step()) {
            assets.push_back(read_asset(stmt));
        }
        return Ok(assets);
    });
}

Result<std::map<std::string, std::size_t>> AssetRepository::count_by_status() const {
    using Counts = std::map<std::string, std::size_t>;
    return guarded<Counts>(db_, "count assets", [&]() -> Result<Counts> {
        Statement stmt(db_, "SELECT status, COUNT(*) FROM assets GROUP BY status");
        Counts counts;
        while (stmt.step()) {
            counts[stmt.column_text(0)] = static_cast<std::size_t>(stmt.column_int64(1));
        }
        return Ok(counts);
    });
}

Result<std::size_t> AssetRepository::fail_interrupted(const std::string& message) {
    return guarded<std::size_t>(db_, "fail interrupted", [&]() -> Result<std::size_t> {
        Statement stmt(db_,
            "UPDATE assets SET status = ?, last_error = ?, processed_at = ? WHERE status = ?");
        stmt.bind(1, model::to_string(AssetStatus::Error))
            .bind(2, message)
            .bind(3, now())
            .bind(4, model::to_string(AssetStatus::Processing));
        stmt.step();
        return Ok(static_cast<std::size_t>(db_.changes()));
    });
}

Result<std::vector<model::DuplicateLink>> AssetRepository::duplicates_of(const std::string& asset_id) const {
    using Links = std::vector<model::DuplicateLink>;
    return guarded<Links>(db_, "list duplicates", [&]() -> Result<Links> {
        Statement stmt(db_,
            "SELECT asset_id, duplicate_of, method, distance, created_at FROM duplicates "
            "WHERE asset_id = ? ORDER BY created_at");
        stmt.bind(1, asset_id);
        Links links;
        while (stmt.step()) {
            model::DuplicateLink link;
            link.asset_id = stmt.column_text(0);
            link.duplicate_of = stmt.column_text(1);
            link.method = model::duplicate_method_from_string(stmt.column_text(2))
                              .value_or(model::DuplicateMethod::Exact);
            link.distance = static_cast<int>(stmt.column_int64(3));
            link.created_at = static_cast<std::time_t>(stmt.column_int64(4));
            links.push_back(std::move(link));
        }
        return Ok(links);
    });
}

Result<void> AssetRepository::append_log(const std::string& asset_id, const std::string& step,
                                         const std::string& status, const std::string& details) {
    return guarded<void>(db_, "append log", [&]() -> Result<void> {
        Statement stmt(db_,
            "INSERT INTO processing_log (asset_id, step, status, details, created_at) VALUES (?,?,?,?,?)");
        stmt.bind(1, asset_id).bind(2, step).bind(3, status).bind(4, details).bind(5, now());
        stmt.step();
        return Ok();
    });
}

Result<std::vector<ProcessingLogEntry>> AssetRepository::log_for(const std::string& asset_id) const {
    using Entries = std::vector<ProcessingLogEntry>;
    return guarded<Entries>(db_, "read log", [&]() -> Result<Entries> {
        Statement stmt(db_,
            "SELECT id, asset_id, step, status, details, created_at FROM processing_log "
            "WHERE asset_id = ? ORDER BY id");
        stmt.bind(1, asset_id);
        Entries entries;
        while (stmt.step()) {
            ProcessingLogEntry entry;
            entry.id = stmt.column_int64(0);
            entry.asset_id = stmt.column_text(1);
            entry.step = stmt.column_text(2);
            entry.status = stmt.column_text(3);
            entry.details = stmt.column_text(4);
            entry.created_at = static_cast<std::time_t>(stmt.column_int64(5));
            entries.push_back(std::move(entry));
        }
        return Ok(entries);
    });
}

Result<bool> AssetRepository::reconcile_batch(const model::BatchRecord& batch) {
    return guarded<bool>(db_, "reconcile batch", [&]() -> Result<bool> {
        Statement stmt(db_,
            "INSERT OR IGNORE INTO batches (batch_id, contributor_token, created_at, decade, event, notes, manifest_id) "
            "VALUES (?,?,?,?,?,?,?)");
        stmt.bind(1, batch.batch_id)
            .bind(2, batch.contributor_token)
            .bind(3, static_cast<std::int64_t>(batch.created_at))
            .bind(4, batch.context.decade)
            .bind(5, batch.context.event)
            .bind(6, batch.context.notes)
            .bind(7, batch.manifest_id);
        stmt.step();
        return Ok(db_.changes() > 0);
    });
}

Result<std::optional<model::BatchRecord>> AssetRepository::find_batch(const std::string& batch_id) const {
    using Found = std::optional<model::BatchRecord>;
    return guarded<Found>(db_, "find batch", [&]() -> Result<Found> {
        Statement stmt(db_,
            "SELECT batch_id, contributor_token, created_at, decade, event, notes, manifest_id "
            "FROM batches WHERE batch_id = ?");
        stmt.bind(1, batch_id);
        if (!stmt.step()) {
            return Ok(Found{});
        }
        model::BatchRecord batch;
        batch.batch_id = stmt.column_text(0);
        batch.contributor_token = stmt.column_text(1);
        batch.created_at = static_cast<std::time_t>(stmt.column_int64(2));
        batch.context.decade = stmt.column_optional_text(3);
        batch.context.event = stmt.column_optional_text(4);
        batch.context.notes = stmt.column_optional_text(5);
        batch.manifest_id = stmt.column_text(6);
        return Ok(Found{batch});
    });
}

Result<bool> AssetRepository::manifest_reconciled(const std::string& manifest_id) const {
    return guarded<bool>(db_, "check manifest", [&]() -> Result<bool> {
        Statement stmt(db_, "SELECT 1 FROM batches WHERE manifest_id = ?");
        stmt.bind(1, manifest_id);
        return Ok(stmt.step());
    });
}

Result<void> AssetRepository::set_state(const std::string& key, const std::string& value) {
    return guarded<void>(db_, "set ops state", [&]() -> Result<void> {
        Statement stmt(db_,
            "INSERT INTO ops_state (key, value, updated_at) VALUES (?,?,?) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at");
        stmt.bind(1, key).bind(2, value).bind(3, now());
        stmt.step();
        return Ok();
    });
}

Result<std::optional<std::string>> AssetRepository::get_state(const std::string& key) const {
    using Found = std::optional<std::string>;
    return guarded<Found>(db_, "get ops state", [&]() -> Result<Found> {
        Statement stmt(db_, "SELECT value FROM ops_state WHERE key = ?");
        stmt.bind(1, key);
        if (!stmt.step()) {
            return Ok(Found{});
        }
        return Ok(Found{stmt.column_text(0)});
    });
}

Result<std::vector<pipeline::FingerprintRecord>> AssetRepository::find_by_sha256(const std::string& sha256) const {
    using Records = std::vector<pipeline::FingerprintRecord>;
    return guarded<Records>(db_, "find by sha256", [&]() -> Result<Records> {
        Statement stmt(db_,
            "SELECT asset_id, sha256, phash, status, created_at, rowid FROM assets "
            "WHERE sha256 = ? ORDER BY created_at, rowid");
        stmt.bind(1, sha256);
        Records records;
        while (stmt.step()) {
            records.push_back(read_fingerprint(stmt));
        }
        return Ok(records);
    });
}

Result<std::vector<pipeline::FingerprintRecord>> AssetRepository::with_phash() const {
    using Records = std::vector<pipeline::FingerprintRecord>;
    return guarded<Records>(db_, "scan phash", [&]() -> Result<Records> {
        Statement stmt(db_,
            "SELECT asset_id, sha256, phash, status, created_at, rowid FROM assets "
            "WHERE phash IS NOT NULL ORDER BY created_at, rowid");
        Records records;
        while (stmt.step()) {
            records.push_back(read_fingerprint(stmt));
        }
        return Ok(records);
    });
}

Result<std::optional<std::int64_t>> AssetRepository::claim_order(const std::string& asset_id) const {
    using Found = std::optional<std::int64_t>;
    return guarded<Found>(db_, "claim order", [&]() -> Result<Found> {
        Statement stmt(db_, "SELECT rowid FROM assets WHERE asset_id = ?");
        stmt.bind(1, asset_id);
        if (!stmt.step()) {
            return Ok(Found{});
        }
        return Ok(Found{stmt.column_int64(0)});
    });
}

Result<std::size_t> AssetRepository::processing_backlog() const {
    return guarded<std::size_t>(db_, "count backlog", [&]() -> Result<std::size_t> {
        Statement stmt(db_, "SELECT COUNT(*) FROM assets WHERE status = ?");
        stmt.bind(1, model::to_string(AssetStatus::Processing));
        stmt.step();
        return Ok(static_cast<std::size_t>(stmt.column_int64(0)));
    });
}

void AssetRepository::write_asset(const Asset& asset) {
    Statement stmt(db_,
        "UPDATE assets SET "
        "asset_id = ?1, origin_file_id = ?2, contributor_token = ?3, batch_id = ?4, "
        "original_filename = ?5, mime_type = ?6, size_bytes = ?7, sha256 = ?8, phash = ?9, "
        "status = ?10, duplicate_of = ?11, duplicate_method = ?12, decade_estimate = ?13, "
        "event = ?14, notes = ?15, caption = ?16, faces_count = ?17, embedding_ref = ?18, "
        "transcript_ref = ?19, duration_seconds = ?20, attempts = ?21, last_error = ?22, "
        "created_at = ?23, processed_at = ?24, exif_date = ?25, decade_confidence = ?26, "
        "gps_lat = ?27, gps_lon = ?28 WHERE asset_id = ?1");
    bind_asset(stmt, asset);
    stmt.step();
    if (db_.changes() == 0) {
        throw DatabaseError("no asset " + asset.asset_id, SQLITE_NOTFOUND);
    }
}

} // namespace vault::persistence
