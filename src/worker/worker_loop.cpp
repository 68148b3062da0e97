#include "vault/worker/worker_loop.hpp"

#include "vault/core/ids.hpp"
#include "vault/events/events.hpp"
#include "vault/model/json.hpp"
#include "vault/pipeline/exif_reader.hpp"
#include "vault/pipeline/routing.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace vault::worker {
namespace fs = std::filesystem;

using model::Asset;
using model::AssetStatus;
using storage::Location;

namespace {

constexpr double kManifestDecadeConfidence = 1.0;

/// A decade from the contributor's manifest outranks one guessed from EXIF.
bool decade_from_manifest(const Asset& asset) {
    return asset.decade_estimate &&
           (!asset.decade_confidence || *asset.decade_confidence >= kManifestDecadeConfidence);
}

void apply_exif(Asset& asset, const pipeline::ExifInfo& exif) {
    asset.exif_date = exif.date_taken;
    asset.gps_lat = exif.gps_lat;
    asset.gps_lon = exif.gps_lon;

    if (decade_from_manifest(asset)) {
        return;
    }
    asset.decade_estimate.reset();
    asset.decade_confidence.reset();
    if (exif.date_taken) {
        if (auto decade = pipeline::decade_from_exif_date(*exif.date_taken)) {
            asset.decade_estimate = decade;
            asset.decade_confidence = pipeline::kExifDecadeConfidence;
        }
    }
}

} // namespace

WorkerLoop::WorkerLoop(config::WorkerConfig config, WorkerDeps deps, events::EventBus* bus)
    : config_(std::move(config))
    , deps_(deps)
    , bus_(bus) {
}

Result<std::size_t> WorkerLoop::recover_interrupted() {
    auto recovered = deps_.assets.fail_interrupted("interrupted: worker stopped during processing");
    if (recovered.is_ok() && recovered.value() > 0) {
        spdlog::warn("Recovered {} assets left in processing", recovered.value());
    }
    return recovered;
}

CycleReport WorkerLoop::run_cycle() {
    const auto started = std::chrono::steady_clock::now();
    CycleReport report;

    report.manifests_reconciled = reconcile_manifests();

    // Retries first: they already hold a claim
    auto errored = deps_.assets.list_by_status(AssetStatus::Error);
    if (errored.is_error()) {
        spdlog::error("Could not list errored assets: {}", errored.error().message);
    } else {
        for (auto& asset : errored.value()) {
            if (asset.attempts >= config_.max_attempts) {
                continue;
            }
            if (!deps_.governor.allow_intake()) {
                report.paused = true;
                break;
            }
            ++report.retried;
            if (retry(asset) == Outcome::Routed) {
                ++report.processed;
            } else {
                ++report.failed;
            }
        }
    }

    auto inbox = deps_.store.list(Location::Inbox);
    if (inbox.is_error()) {
        spdlog::error("Could not list inbox: {}", inbox.error().message);
    } else {
        const auto& blobs = inbox.value();
        for (std::size_t i = 0; i < blobs.size(); ++i) {
            auto known = deps_.assets.find_by_origin(blobs[i].id);
            if (known.is_error()) {
                spdlog::error("Lookup of {} failed: {}", blobs[i].id, known.error().message);
                continue;
            }
            if (known.value()) {
                continue;
            }

            if (report.paused || !deps_.governor.allow_intake()) {
                report.paused = true;
                report.skipped = blobs.size() - i;
                break;
            }

            const Outcome outcome = process_new(blobs[i]);
            if (outcome == Outcome::Routed) {
                ++report.processed;
            } else if (outcome == Outcome::Failed) {
                ++report.failed;
            }
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    record_cycle(report);
    return report;
}

void WorkerLoop::run_forever(const std::atomic<bool>& stop) {
    spdlog::info("Worker polling every {}s", config_.poll_interval_seconds);
    while (!stop.load()) {
        run_cycle();

        const auto wake = std::chrono::steady_clock::now() + std::chrono::seconds(config_.poll_interval_seconds);
        while (!stop.load() && std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }
    spdlog::info("Worker stopped");
}

// ──────────────────────────────────────────────────────────
// Manifests
// ──────────────────────────────────────────────────────────

std::size_t WorkerLoop::reconcile_manifests() {
    auto listed = deps_.store.list(Location::Manifests);
    if (listed.is_error()) {
        spdlog::error("Could not list manifests: {}", listed.error().message);
        return 0;
    }

    std::size_t reconciled = 0;
    for (const auto& blob : listed.value()) {
        if (manifests_.count(blob.id) == 0) {
            auto bytes = deps_.store.read(blob.id);
            if (bytes.is_error()) {
                spdlog::warn("Manifest {} unreadable: {}", blob.id, bytes.error().message);
                continue;
            }

            model::json document;
            try {
                document = model::json::parse(bytes.value().begin(), bytes.value().end());
            } catch (const model::json::parse_error& e) {
                spdlog::warn("Manifest {} is not JSON: {}", blob.id, e.what());
                continue;
            }

            auto manifest = model::manifest_from_json(document);
            if (manifest.is_error()) {
                spdlog::warn("Manifest {} rejected: {}", blob.id, manifest.error().message);
                continue;
            }
            index_manifest(manifest.value());
            manifests_.emplace(blob.id, std::move(manifest.value()));
        }

        const model::Manifest& manifest = manifests_.at(blob.id);
        model::BatchRecord record;
        record.batch_id = manifest.batch_id;
        record.contributor_token = manifest.contributor_token;
        record.created_at = manifest.created_at;
        record.context = manifest.context;
        record.manifest_id = blob.id;

        auto inserted = deps_.assets.reconcile_batch(record);
        if (inserted.is_error()) {
            spdlog::error("Could not reconcile manifest {}: {}", blob.id, inserted.error().message);
            continue;
        }
        if (inserted.value()) {
            spdlog::info("Reconciled batch {} ({} files)", manifest.batch_id, manifest.files.size());
            ++reconciled;
        }
    }
    return reconciled;
}

void WorkerLoop::index_manifest(const model::Manifest& manifest) {
    for (const auto& file : manifest.files) {
        attribution_[file.origin_file_id] = Attribution{manifest.batch_id, manifest.contributor_token,
                                                        manifest.context};
    }
}

// ──────────────────────────────────────────────────────────
// Per-file pipeline
// ──────────────────────────────────────────────────────────

WorkerLoop::Outcome WorkerLoop::process_new(const storage::BlobInfo& blob) {
    Asset asset;
    asset.asset_id = generate_uuid();
    asset.origin_file_id = blob.id;
    asset.original_filename = blob.name;
    asset.mime_type = blob.mime_type;
    asset.size_bytes = blob.size_bytes;
    asset.status = AssetStatus::Processing;
    asset.created_at = std::time(nullptr);

    auto attributed = attribution_.find(blob.id);
    if (attributed != attribution_.end()) {
        asset.batch_id = attributed->second.batch_id;
        asset.contributor_token = attributed->second.contributor_token;
        asset.decade_estimate = attributed->second.context.decade;
        if (asset.decade_estimate) {
            asset.decade_confidence = kManifestDecadeConfidence;
        }
        asset.event = attributed->second.context.event;
        asset.notes = attributed->second.context.notes;
    }

    auto claimed = deps_.assets.claim(asset);
    if (claimed.is_error()) {
        spdlog::error("Claim of {} failed: {}", blob.id, claimed.error().message);
        return Outcome::Failed;
    }
    if (!claimed.value()) {
        spdlog::debug("{} already claimed", blob.id);
        return Outcome::Skipped;
    }
    log_step(asset.asset_id, "claim", "ok", blob.name);

    return run_pipeline(asset, blob.location);
}

WorkerLoop::Outcome WorkerLoop::retry(Asset asset) {
    spdlog::info("Retrying {} (attempt {} of {})", asset.asset_id, asset.attempts + 1, config_.max_attempts);

    auto moved = pipeline::transition(asset, AssetStatus::Processing);
    if (moved.is_error()) {
        return fail(asset, "retry", moved.error().message, {});
    }

    auto blob = deps_.store.stat(asset.origin_file_id);
    if (blob.is_error()) {
        return fail(asset, "locate", blob.error().message, {});
    }

    auto updated = deps_.assets.update(asset);
    if (updated.is_error()) {
        spdlog::error("Could not mark {} processing: {}", asset.asset_id, updated.error().message);
        return Outcome::Failed;
    }
    log_step(asset.asset_id, "retry", "ok", "attempt " + std::to_string(asset.attempts + 1));

    return run_pipeline(asset, blob.value().location);
}

WorkerLoop::Outcome WorkerLoop::run_pipeline(Asset& asset, Location current) {
    const fs::path cache_path = cache_path_for(asset);

    if (current != Location::Processing) {
        auto moved = deps_.store.move(asset.origin_file_id, Location::Processing);
        if (moved.is_error()) {
            return fail(asset, "move", moved.error().message, {});
        }
    }

    std::error_code ec;
    fs::create_directories(cache_path.parent_path(), ec);
    auto downloaded = deps_.store.download(asset.origin_file_id, cache_path);
    if (downloaded.is_error()) {
        return fail(asset, "download", downloaded.error().message, cache_path);
    }
    log_step(asset.asset_id, "download", "ok", cache_path.string());

    const model::MediaKind media = model::media_kind_from_mime(asset.mime_type);
    asset.duration_seconds = deps_.probe.duration_seconds(cache_path, asset.mime_type);

    auto fingerprint = fingerprints_.fingerprint(cache_path, asset.mime_type);
    if (fingerprint.is_error()) {
        return fail(asset, "fingerprint", fingerprint.error().message, cache_path);
    }
    asset.sha256 = fingerprint.value().sha256;
    asset.phash = fingerprint.value().phash;
    log_step(asset.asset_id, "fingerprint", "ok", asset.sha256);

    if (media == model::MediaKind::Image) {
        auto exif = pipeline::read_exif(cache_path);
        if (exif.is_error()) {
            spdlog::warn("EXIF of {} not read: {}", asset.asset_id, exif.error().message);
        } else {
            apply_exif(asset, exif.value());
        }
    }

    auto dedup = deps_.dedup.resolve({asset.asset_id, asset.sha256, asset.phash});
    if (dedup.is_error()) {
        return fail(asset, "dedup", dedup.error().message, cache_path);
    }
    const pipeline::DedupOutcome& match = dedup.value();
    log_step(asset.asset_id, "dedup", match.is_duplicate() ? "duplicate" : "unique",
             match.duplicate_of.value_or(""));

    model::EnrichmentResult enrichment = deps_.enrichment.enrich(cache_path, media, asset.duration_seconds,
                                                                 asset.asset_id);
    asset.caption = enrichment.caption;
    asset.faces_count = enrichment.faces.size();
    asset.embedding_ref = enrichment.embedding_ref;
    asset.transcript_ref = enrichment.transcript_ref;
    log_step(asset.asset_id, "enrich", enrichment.errors.empty() ? "ok" : "partial",
             std::to_string(enrichment.errors.size()) + " errors");

    pipeline::RoutingInput input;
    input.media = media;
    input.dedup = match;
    input.transcription_deferred = enrichment.transcription_deferred;
    const pipeline::RoutingDecision decision = pipeline::route(input);

    auto transitioned = pipeline::transition(asset, decision.status);
    if (transitioned.is_error()) {
        return fail(asset, "route", transitioned.error().message, cache_path);
    }

    std::optional<model::DuplicateLink> link;
    if (decision.create_duplicate_link) {
        asset.duplicate_of = match.duplicate_of;
        asset.duplicate_method = match.method;
        link = model::DuplicateLink{asset.asset_id, *match.duplicate_of, match.method, match.distance,
                                    std::time(nullptr)};
    }
    asset.last_error.clear();
    asset.processed_at = std::time(nullptr);

    auto sidecar = deps_.sidecars.write(asset, enrichment);
    if (sidecar.is_error()) {
        asset.status = AssetStatus::Processing;
        return fail(asset, "sidecar", sidecar.error().message, cache_path, &enrichment);
    }

    auto relocated = deps_.store.move(asset.origin_file_id, decision.location);
    if (relocated.is_error()) {
        asset.status = AssetStatus::Processing;
        return fail(asset, "relocate", relocated.error().message, cache_path, &enrichment);
    }

    auto persisted = deps_.assets.record_outcome(asset, link);
    if (persisted.is_error()) {
        asset.status = AssetStatus::Processing;
        return fail(asset, "persist", persisted.error().message, cache_path, &enrichment);
    }
    log_step(asset.asset_id, "route", model::to_string(asset.status), storage::to_string(decision.location));

    fs::remove(cache_path, ec);

    if (bus_ != nullptr) {
        if (link) {
            bus_->emit(events::DuplicateDetectedEvent{asset.asset_id, link->duplicate_of, link->method,
                                                      link->distance});
        }
        bus_->emit(events::AssetRoutedEvent{asset.asset_id, asset.origin_file_id, asset.status,
                                            storage::to_string(decision.location)});
    }
    return Outcome::Routed;
}

WorkerLoop::Outcome WorkerLoop::fail(Asset& asset, const std::string& stage, const std::string& message,
                                     const fs::path& cache_path, const model::EnrichmentResult* enrichment) {
    spdlog::error("Asset {} failed at {}: {}", asset.asset_id, stage, message);

    // A failed asset keeps no partial routing
    asset.duplicate_of.reset();
    asset.duplicate_method.reset();
    asset.status = AssetStatus::Error;
    asset.attempts += 1;
    asset.last_error = stage + ": " + message;
    asset.processed_at = std::time(nullptr);

    auto updated = deps_.assets.update(asset);
    if (updated.is_error()) {
        spdlog::error("Could not record failure of {}: {}", asset.asset_id, updated.error().message);
    }
    log_step(asset.asset_id, stage, "error", message);

    // A sidecar may already carry the routed status
    if (enrichment != nullptr) {
        auto rewritten = deps_.sidecars.write(asset, *enrichment);
        if (rewritten.is_error()) {
            spdlog::warn("Sidecar of {} still shows its last routing: {}", asset.asset_id,
                         rewritten.error().message);
        }
    }

    if (!cache_path.empty()) {
        std::error_code ec;
        fs::remove(cache_path, ec);
    }

    if (bus_ != nullptr) {
        bus_->emit(events::AssetFailedEvent{asset.asset_id, asset.origin_file_id, stage, message, asset.attempts});
    }
    return Outcome::Failed;
}

void WorkerLoop::log_step(const std::string& asset_id, const std::string& step,
                          const std::string& status, const std::string& details) {
    auto logged = deps_.assets.append_log(asset_id, step, status, details);
    if (logged.is_error()) {
        spdlog::warn("Processing log write failed for {}: {}", asset_id, logged.error().message);
    }
}

fs::path WorkerLoop::cache_path_for(const Asset& asset) const {
    // Keep the extension; some decoders pick a backend by it
    return fs::path(config_.cache_dir) / (asset.asset_id + fs::path(asset.original_filename).extension().string());
}

void WorkerLoop::record_cycle(const CycleReport& report) {
    const model::json summary{
        {"manifests_reconciled", report.manifests_reconciled},
        {"processed", report.processed},
        {"failed", report.failed},
        {"retried", report.retried},
        {"skipped", report.skipped},
        {"paused", report.paused},
        {"duration_ms", report.duration.count()}
    };

    auto stamped = deps_.assets.set_state("last_worker_run", format_iso8601(std::time(nullptr)));
    if (stamped.is_error()) {
        spdlog::error("Could not record last_worker_run: {}", stamped.error().message);
    }
    auto stored = deps_.assets.set_state("last_cycle_report", summary.dump());
    if (stored.is_error()) {
        spdlog::error("Could not record cycle report: {}", stored.error().message);
    }

    if (bus_ != nullptr) {
        bus_->emit(events::WorkerCycleCompletedEvent{report.manifests_reconciled, report.processed,
                                                     report.failed, report.skipped, report.paused,
                                                     report.duration});
    }
}

} // namespace vault::worker
