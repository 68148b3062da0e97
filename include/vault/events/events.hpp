/**
 * @file events.hpp
 * @brief Event types emitted by the intake server and the ingest worker
 *
 * NAMING CONVENTION:
 * Events are past-tense: UploadCompletedEvent, AssetRoutedEvent
 */

#pragma once

#include "vault/model/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace vault::events {

// ════════════════════════════════════════════════════════
// Server Lifecycle
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    uint16_t port;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct ServerShuttingDownEvent {
    std::string reason;
};

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when init_upload opens a resumable session
 *
 * WHO SUBSCRIBES:
 * - Logger
 * - Metrics (uploads_started)
 */
struct UploadInitiatedEvent {
    std::string session_id;
    std::string contributor_token;
    std::string filename;
    std::uint64_t total_bytes = 0;
};

struct ChunkAcceptedEvent {
    std::string session_id;
    std::uint64_t first_byte = 0;
    std::uint64_t bytes = 0;
    std::uint64_t committed_offset = 0;
    std::uint64_t total_bytes = 0;
};

/**
 * @brief Emitted when a client is told to resume from the stored offset
 *
 * Either an explicit probe or a chunk whose first byte did not line up
 * with the committed offset.
 */
struct UploadResumedEvent {
    std::string session_id;
    std::uint64_t next_offset = 0;
    bool explicit_probe = false;
};

struct UploadCompletedEvent {
    std::string session_id;
    std::string origin_file_id;
    std::string filename;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
};

struct UploadExpiredEvent {
    std::string session_id;
    std::uint64_t committed_offset = 0;
};

// ════════════════════════════════════════════════════════
// Batch Events
// ════════════════════════════════════════════════════════

struct BatchCreatedEvent {
    std::string batch_id;
    std::string contributor_token;
};

struct BatchFinishedEvent {
    std::string batch_id;
    std::string manifest_id;
    std::size_t total_files = 0;
    std::uint64_t total_bytes = 0;
};

// ════════════════════════════════════════════════════════
// Worker Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once per asset when it reaches a holding state
 *
 * WHO SUBSCRIBES:
 * - Logger
 * - Metrics (per-status counters)
 */
struct AssetRoutedEvent {
    std::string asset_id;
    std::string origin_file_id;
    model::AssetStatus status = model::AssetStatus::NeedsReview;
    std::string location;
};

struct DuplicateDetectedEvent {
    std::string asset_id;
    std::string duplicate_of;
    model::DuplicateMethod method = model::DuplicateMethod::Exact;
    int distance = 0;
};

struct AssetFailedEvent {
    std::string asset_id;
    std::string origin_file_id;
    std::string stage;
    std::string message;
    int attempts = 0;
};

/**
 * @brief An enricher failed; the asset still continues through the pipeline
 */
struct EnricherFailedEvent {
    std::string asset_id;
    std::string enricher;
    std::string message;
};

struct IntakePausedEvent {
    std::string reason;
    std::uint64_t free_bytes = 0;
    std::size_t backlog = 0;
};

struct WorkerCycleCompletedEvent {
    std::size_t manifests_reconciled = 0;
    std::size_t processed = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    bool paused = false;
    std::chrono::milliseconds duration{0};
};

} // namespace vault::events
