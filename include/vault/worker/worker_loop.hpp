#pragma once

/**
 * @file worker_loop.hpp
 * @brief Sequential ingest of inbox files into holding states
 *
 * WHAT IT DOES:
 * Each cycle reconciles new manifests into batches, then takes inbox files
 * one at a time through:
 *   claim -> move to processing -> download -> probe duration ->
 *   fingerprint -> EXIF (images) -> dedup -> enrich -> route -> sidecar ->
 *   move to holding -> persist -> delete cache copy
 *
 * A failure after the sidecar was written rewrites it with status error.
 *
 * The routed status is committed last, so a holding status in the
 * database always means the blob already sits in its holding folder. A
 * crash in between leaves the asset in processing, which
 * recover_interrupted() turns into a retryable error.
 *
 * Re-running a cycle with no new input changes nothing: claimed files are
 * no longer in the inbox and reconciled manifests are remembered.
 */

#include "vault/config/config.hpp"
#include "vault/core/result.hpp"
#include "vault/events/event_bus.hpp"
#include "vault/model/types.hpp"
#include "vault/persistence/asset_repository.hpp"
#include "vault/persistence/sidecar_writer.hpp"
#include "vault/pipeline/backpressure.hpp"
#include "vault/pipeline/dedup.hpp"
#include "vault/pipeline/enrichment.hpp"
#include "vault/pipeline/fingerprint.hpp"
#include "vault/pipeline/media_probe.hpp"
#include "vault/storage/blob_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>

namespace vault::worker {

struct CycleReport {
    std::size_t manifests_reconciled = 0;
    std::size_t processed = 0;
    std::size_t failed = 0;
    std::size_t retried = 0;
    std::size_t skipped = 0;         // Left in the inbox because intake paused
    bool paused = false;
    std::chrono::milliseconds duration{0};
};

/// Collaborators the loop drives; all must outlive it.
struct WorkerDeps {
    storage::BlobStore& store;
    persistence::AssetRepository& assets;
    pipeline::DedupResolver& dedup;
    pipeline::EnrichmentOrchestrator& enrichment;
    pipeline::BackpressureGovernor& governor;
    persistence::SidecarWriter& sidecars;
    const pipeline::MediaProbe& probe;
};

class WorkerLoop {
public:
    WorkerLoop(config::WorkerConfig config, WorkerDeps deps, events::EventBus* bus = nullptr);

    CycleReport run_cycle();

    /// Cycle every poll_interval_seconds until @p stop is set.
    void run_forever(const std::atomic<bool>& stop);

    /**
     * @brief Fail assets a previous run left in processing
     *
     * Call once at startup, before the first cycle.
     */
    Result<std::size_t> recover_interrupted();

private:
    struct Attribution {
        std::string batch_id;
        std::string contributor_token;
        model::BatchContext context;
    };

    enum class Outcome {
        Routed,
        Failed,
        Skipped      // Claimed by another run
    };

    std::size_t reconcile_manifests();
    void index_manifest(const model::Manifest& manifest);

    Outcome process_new(const storage::BlobInfo& blob);
    Outcome retry(model::Asset asset);
    Outcome run_pipeline(model::Asset& asset, storage::Location current);

    /// @p enrichment, when given, is used to rewrite the sidecar with status error.
    Outcome fail(model::Asset& asset, const std::string& stage, const std::string& message,
                 const std::filesystem::path& cache_path,
                 const model::EnrichmentResult* enrichment = nullptr);
    void log_step(const std::string& asset_id, const std::string& step,
                  const std::string& status, const std::string& details = {});

    std::filesystem::path cache_path_for(const model::Asset& asset) const;
    void record_cycle(const CycleReport& report);

    config::WorkerConfig config_;
    WorkerDeps deps_;
    events::EventBus* bus_;
    pipeline::FingerprintEngine fingerprints_;

    std::map<std::string, model::Manifest> manifests_;            // manifest blob id -> parsed
    std::unordered_map<std::string, Attribution> attribution_;    // origin_file_id -> batch
};

} // namespace vault::worker
