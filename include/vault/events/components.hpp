/**
 * @file components.hpp
 * @brief Event-driven logging and metrics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Services emit, components react
 */

#pragma once

#include "vault/events/event_bus.hpp"
#include "vault/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace vault::events {

/**
 * @brief Logs every domain event using spdlog
 *
 * Chunk-level traffic goes to debug, everything else to info or warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Server started on port {}", e.port);
            spdlog::info("════════════════════════════════════════════");
        });

        bus_.subscribe<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("Server shutting down: {}", e.reason);
        });

        bus_.subscribe<UploadInitiatedEvent>([](const UploadInitiatedEvent& e) {
            spdlog::info("[UploadInitiated] session={} contributor={} file={} bytes={}",
                         e.session_id, e.contributor_token, e.filename, e.total_bytes);
        });

        bus_.subscribe<ChunkAcceptedEvent>([](const ChunkAcceptedEvent& e) {
            spdlog::debug("[ChunkAccepted] session={} first={} bytes={} committed={}/{}",
                          e.session_id, e.first_byte, e.bytes, e.committed_offset, e.total_bytes);
        });

        bus_.subscribe<UploadResumedEvent>([](const UploadResumedEvent& e) {
            spdlog::info("[UploadResumed] session={} next_offset={} probe={}",
                         e.session_id, e.next_offset, e.explicit_probe);
        });

        bus_.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] session={} origin_file_id={} file={} bytes={} duration={}ms",
                         e.session_id, e.origin_file_id, e.filename, e.total_bytes, e.duration.count());
        });

        bus_.subscribe<UploadExpiredEvent>([](const UploadExpiredEvent& e) {
            spdlog::warn("[UploadExpired] session={} committed={}", e.session_id, e.committed_offset);
        });

        bus_.subscribe<BatchCreatedEvent>([](const BatchCreatedEvent& e) {
            spdlog::info("[BatchCreated] batch={} contributor={}", e.batch_id, e.contributor_token);
        });

        bus_.subscribe<BatchFinishedEvent>([](const BatchFinishedEvent& e) {
            spdlog::info("[BatchFinished] batch={} manifest={} files={} bytes={}",
                         e.batch_id, e.manifest_id, e.total_files, e.total_bytes);
        });

        bus_.subscribe<AssetRoutedEvent>([](const AssetRoutedEvent& e) {
            spdlog::info("[AssetRouted] asset={} origin_file_id={} status={} location={}",
                         e.asset_id, e.origin_file_id, model::to_string(e.status), e.location);
        });

        bus_.subscribe<DuplicateDetectedEvent>([](const DuplicateDetectedEvent& e) {
            spdlog::info("[DuplicateDetected] asset={} duplicate_of={} method={} distance={}",
                         e.asset_id, e.duplicate_of, model::to_string(e.method), e.distance);
        });

        bus_.subscribe<AssetFailedEvent>([](const AssetFailedEvent& e) {
            spdlog::error("[AssetFailed] asset={} origin_file_id={} stage={} attempts={} error={}",
                          e.asset_id, e.origin_file_id, e.stage, e.attempts, e.message);
        });

        bus_.subscribe<EnricherFailedEvent>([](const EnricherFailedEvent& e) {
            spdlog::warn("[EnricherFailed] asset={} enricher={} error={}", e.asset_id, e.enricher, e.message);
        });

        bus_.subscribe<IntakePausedEvent>([](const IntakePausedEvent& e) {
            spdlog::warn("[IntakePaused] reason={} free_bytes={} backlog={}", e.reason, e.free_bytes, e.backlog);
        });

        bus_.subscribe<WorkerCycleCompletedEvent>([](const WorkerCycleCompletedEvent& e) {
            spdlog::info("[CycleCompleted] manifests={} processed={} failed={} skipped={} paused={} duration={}ms",
                         e.manifests_reconciled, e.processed, e.failed, e.skipped, e.paused, e.duration.count());
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Tracks counters for monitoring
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_expired{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> chunks_accepted{0};
        std::atomic<uint64_t> resumes{0};
        std::atomic<uint64_t> batches_finished{0};
        std::atomic<uint64_t> assets_routed{0};
        std::atomic<uint64_t> needs_review{0};
        std::atomic<uint64_t> possible_duplicates{0};
        std::atomic<uint64_t> transcribe_later{0};
        std::atomic<uint64_t> assets_failed{0};
        std::atomic<uint64_t> enricher_failures{0};
        std::atomic<uint64_t> intake_pauses{0};
        std::atomic<uint64_t> worker_cycles{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadInitiatedEvent>([this](const UploadInitiatedEvent&) {
            stats_.uploads_started++;
        });

        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            stats_.chunks_accepted++;
            stats_.bytes_uploaded += e.bytes;
        });

        bus_.subscribe<UploadResumedEvent>([this](const UploadResumedEvent&) {
            stats_.resumes++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });

        bus_.subscribe<UploadExpiredEvent>([this](const UploadExpiredEvent&) {
            stats_.uploads_expired++;
        });

        bus_.subscribe<BatchFinishedEvent>([this](const BatchFinishedEvent&) {
            stats_.batches_finished++;
        });

        bus_.subscribe<AssetRoutedEvent>([this](const AssetRoutedEvent& e) {
            on_asset_routed(e);
        });

        bus_.subscribe<AssetFailedEvent>([this](const AssetFailedEvent&) {
            stats_.assets_failed++;
        });

        bus_.subscribe<EnricherFailedEvent>([this](const EnricherFailedEvent&) {
            stats_.enricher_failures++;
        });

        bus_.subscribe<IntakePausedEvent>([this](const IntakePausedEvent&) {
            stats_.intake_pauses++;
        });

        bus_.subscribe<WorkerCycleCompletedEvent>([this](const WorkerCycleCompletedEvent&) {
            stats_.worker_cycles++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Session Statistics:");
        spdlog::info("  Uploads started:    {}", stats_.uploads_started.load());
        spdlog::info("  Uploads completed:  {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads expired:    {}", stats_.uploads_expired.load());
        spdlog::info("  Chunks accepted:    {}", stats_.chunks_accepted.load());
        spdlog::info("  Bytes uploaded:     {}", stats_.bytes_uploaded.load());
        spdlog::info("  Resumes:            {}", stats_.resumes.load());
        spdlog::info("  Batches finished:   {}", stats_.batches_finished.load());
        spdlog::info("  Assets routed:      {}", stats_.assets_routed.load());
        spdlog::info("    needs_review:     {}", stats_.needs_review.load());
        spdlog::info("    possible_dup:     {}", stats_.possible_duplicates.load());
        spdlog::info("    transcribe_later: {}", stats_.transcribe_later.load());
        spdlog::info("  Assets failed:      {}", stats_.assets_failed.load());
        spdlog::info("  Enricher failures:  {}", stats_.enricher_failures.load());
        spdlog::info("  Intake pauses:      {}", stats_.intake_pauses.load());
        spdlog::info("  Worker cycles:      {}", stats_.worker_cycles.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_asset_routed(const AssetRoutedEvent& e) {
        stats_.assets_routed++;
        switch (e.status) {
            case model::AssetStatus::NeedsReview:
                stats_.needs_review++;
                break;
            case model::AssetStatus::PossibleDuplicate:
                stats_.possible_duplicates++;
                break;
            case model::AssetStatus::TranscribeLater:
                stats_.transcribe_later++;
                break;
            default:
                break;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace vault::events
