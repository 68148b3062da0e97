#pragma once

/**
 * @file types.hpp
 * @brief Core domain types for the ingest pipeline
 *
 * WHAT LIVES HERE:
 * - Asset: one ingested media file tracked from intake to holding state
 * - DuplicateLink: immutable record tying an asset to an earlier one
 * - UploadSession / PendingBatch: intake-side state owned by the upload path
 * - Manifest: immutable, finalized description of a contributor batch
 *
 * DESIGN DECISIONS:
 * - Plain structs, behaviour lives in the services that own them
 * - Timestamps are std::time_t (seconds since epoch), rendered as ISO-8601
 *   in JSON and SQLite
 * - Optional attributes use std::optional rather than sentinel strings
 */

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace vault {
namespace model {

/**
 * @brief Closed set of asset states
 *
 * STATE TRANSITIONS (see pipeline/routing.hpp):
 * Uploaded → Processing
 * Processing → NeedsReview | PossibleDuplicate | TranscribeLater | Error
 * Error → Processing (bounded retry)
 * holding states → Approved | Archived | Rejected (curation collaborator)
 */
enum class AssetStatus {
    Uploaded,
    Processing,
    NeedsReview,
    PossibleDuplicate,
    TranscribeLater,
    Error,
    Approved,
    Archived,
    Rejected
};

std::string to_string(AssetStatus status);

/**
 * @brief Parse a status spelling, accepting the curation layer's variants
 *
 * "pending" maps to NeedsReview, "possible_duplicates" to
 * PossibleDuplicate. Unknown spellings yield std::nullopt.
 */
std::optional<AssetStatus> status_from_string(const std::string& text);

enum class DuplicateMethod {
    Exact,
    Near
};

std::string to_string(DuplicateMethod method);
std::optional<DuplicateMethod> duplicate_method_from_string(const std::string& text);

enum class MediaKind {
    Image,
    Video,
    Audio,
    Other
};

MediaKind media_kind_from_mime(const std::string& mime_type);
std::string to_string(MediaKind kind);

struct Asset {
    std::string asset_id;
    std::string origin_file_id;
    std::string contributor_token;
    std::string batch_id;
    std::string original_filename;
    std::string mime_type;
    std::uint64_t size_bytes = 0;
    std::string sha256;                          // Empty until fingerprinted
    std::optional<std::string> phash;            // 16 hex chars, images only
    AssetStatus status = AssetStatus::Uploaded;
    std::optional<std::string> duplicate_of;
    std::optional<DuplicateMethod> duplicate_method;
    std::optional<std::string> decade_estimate;
    std::optional<double> decade_confidence;     // 1.0 from a manifest, 0.6 from EXIF
    std::optional<std::string> exif_date;        // DateTimeOriginal as recorded
    std::optional<double> gps_lat;
    std::optional<double> gps_lon;
    std::optional<std::string> event;
    std::optional<std::string> notes;
    std::optional<std::string> caption;
    std::size_t faces_count = 0;
    std::optional<std::string> embedding_ref;
    std::optional<std::string> transcript_ref;
    std::optional<double> duration_seconds;
    int attempts = 0;
    std::string last_error;
    std::time_t created_at = 0;
    std::time_t processed_at = 0;
};

struct DuplicateLink {
    std::string asset_id;
    std::string duplicate_of;
    DuplicateMethod method = DuplicateMethod::Exact;
    int distance = 0;                            // Hamming distance, 0 for exact
    std::time_t created_at = 0;
};

/**
 * @brief Resumable upload state, persisted after every offset change
 *
 * committed_offset is monotonically non-decreasing and never exceeds
 * total_bytes.
 */
struct UploadSession {
    std::string session_id;
    std::string remote_handle;
    std::string contributor_token;
    std::string filename;
    std::string mime_type;
    std::uint64_t total_bytes = 0;
    std::uint64_t committed_offset = 0;
    std::string batch_id;                        // Empty when not part of a batch
    std::time_t created_at = 0;
    std::time_t updated_at = 0;
};

struct ManifestFile {
    std::string origin_file_id;
    std::string original_name;
    std::uint64_t size_bytes = 0;
};

struct BatchContext {
    std::optional<std::string> decade;
    std::optional<std::string> event;
    std::optional<std::string> notes;
};

/**
 * @brief Batch still accepting files on the intake side
 */
struct PendingBatch {
    std::string batch_id;
    std::string contributor_token;
    std::time_t created_at = 0;
    std::vector<ManifestFile> files;             // Append-only until finish
    bool finalized = false;
};

struct Manifest {
    std::string batch_id;
    std::string contributor_token;
    std::string contributor_name;
    std::time_t created_at = 0;
    std::time_t finished_at = 0;
    BatchContext context;
    std::vector<ManifestFile> files;

    std::uint64_t total_bytes() const {
        std::uint64_t total = 0;
        for (const auto& file : files) {
            total += file.size_bytes;
        }
        return total;
    }
};

/**
 * @brief Batch attribution after the worker reconciled its manifest
 */
struct BatchRecord {
    std::string batch_id;
    std::string contributor_token;
    std::time_t created_at = 0;
    BatchContext context;
    std::string manifest_id;
};

struct DetectedFace {
    std::vector<double> bbox;                    // x1, y1, x2, y2
    double confidence = 0.0;
};

struct TranscriptSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

/**
 * @brief Merged output of all enrichers run against one asset
 */
struct EnrichmentResult {
    std::vector<DetectedFace> faces;
    std::optional<std::string> caption;
    std::optional<std::string> embedding_ref;
    std::optional<std::string> transcript_ref;
    bool transcription_deferred = false;
    std::vector<std::string> errors;
};

} // namespace model
} // namespace vault
