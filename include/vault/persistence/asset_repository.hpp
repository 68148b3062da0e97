#pragma once

/**
 * @file asset_repository.hpp
 * @brief Metadata store for assets, duplicate links, batches and ops state
 *
 * TABLES:
 * - assets: one row per ingested file, unique on origin_file_id; the
 *   rowid records claim order
 * - duplicates: immutable links from an asset to an earlier one
 * - batches: manifests reconciled by the worker
 * - processing_log: per-stage outcomes, append only
 * - ops_state: key/value pairs such as last_worker_run
 *
 * Every public method converts DatabaseError into ErrorCode::Storage.
 */

#include "vault/core/result.hpp"
#include "vault/model/types.hpp"
#include "vault/persistence/database.hpp"
#include "vault/pipeline/backpressure.hpp"
#include "vault/pipeline/dedup.hpp"

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vault::persistence {

struct ProcessingLogEntry {
    std::int64_t id = 0;
    std::string asset_id;
    std::string step;
    std::string status;
    std::string details;
    std::time_t created_at = 0;
};

class AssetRepository : public pipeline::FingerprintIndex, public pipeline::BacklogSource {
public:
    explicit AssetRepository(Database& db);

    /// Create tables and indexes if missing.
    Result<void> migrate();

    /**
     * @brief Insert @p asset unless its origin_file_id is already present
     *
     * RETURNS:
     * true when this call created the row. The unique constraint makes
     * concurrent claims of one file resolve to a single winner.
     */
    Result<bool> claim(const model::Asset& asset);

    Result<void> update(const model::Asset& asset);

    /**
     * @brief Persist a routed asset and its duplicate link atomically
     */
    Result<void> record_outcome(const model::Asset& asset,
                                const std::optional<model::DuplicateLink>& link);

    Result<std::optional<model::Asset>> find(const std::string& asset_id) const;
    Result<std::optional<model::Asset>> find_by_origin(const std::string& origin_file_id) const;
    Result<std::vector<model::Asset>> list_by_status(model::AssetStatus status) const;
    Result<std::map<std::string, std::size_t>> count_by_status() const;

    /**
     * @brief Move every asset left in processing to error
     *
     * RETURNS:
     * Number of assets changed.
     */
    Result<std::size_t> fail_interrupted(const std::string& message);

    Result<std::vector<model::DuplicateLink>> duplicates_of(const std::string& asset_id) const;

    Result<void> append_log(const std::string& asset_id, const std::string& step,
                            const std::string& status, const std::string& details);
    Result<std::vector<ProcessingLogEntry>> log_for(const std::string& asset_id) const;

    /// Insert a reconciled manifest; false when its manifest_id was seen before.
    Result<bool> reconcile_batch(const model::BatchRecord& batch);
    Result<std::optional<model::BatchRecord>> find_batch(const std::string& batch_id) const;
    Result<bool> manifest_reconciled(const std::string& manifest_id) const;

    Result<void> set_state(const std::string& key, const std::string& value);
    Result<std::optional<std::string>> get_state(const std::string& key) const;

    // FingerprintIndex
    Result<std::vector<pipeline::FingerprintRecord>> find_by_sha256(const std::string& sha256) const override;
    Result<std::vector<pipeline::FingerprintRecord>> with_phash() const override;
    Result<std::optional<std::int64_t>> claim_order(const std::string& asset_id) const override;

    // BacklogSource
    Result<std::size_t> processing_backlog() const override;

private:
    void write_asset(const model::Asset& asset);

    Database& db_;
};

} // namespace vault::persistence
