#pragma once

/**
 * @file session_manager.hpp
 * @brief Resumable chunked uploads from contributors
 *
 * WHY THIS FILE EXISTS:
 * Contributors upload multi-gigabyte videos over home connections that
 * drop. Every acknowledged byte is committed to the blob store before the
 * offset advances, so a client that reconnects asks where to continue and
 * never re-sends or loses data.
 *
 * PROTOCOL:
 * 1. init_upload validates the token and size and opens a remote session
 * 2. put_chunk with "Content-Range: bytes first-last/total" appends bytes
 * 3. A chunk whose first byte does not match the committed offset, an
 *    empty chunk, or "bytes * /total" is answered with the offset to
 *    resume from
 * 4. The chunk that reaches total finalizes the blob into the inbox
 *
 * CONCURRENCY:
 * Chunks of one session are serialized by a per-session mutex; different
 * sessions run in parallel on the HTTP threads.
 */

#include "vault/config/config.hpp"
#include "vault/core/result.hpp"
#include "vault/events/event_bus.hpp"
#include "vault/intake/contributors.hpp"
#include "vault/intake/state_store.hpp"
#include "vault/storage/blob_store.hpp"

#include <cstdint>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace vault::intake {

struct InitUploadRequest {
    std::string contributor_token;
    std::string filename;
    std::string mime_type;
    std::uint64_t size_bytes = 0;
    std::optional<std::string> batch_id;
};

struct InitUploadResponse {
    std::string session_id;
    std::uint64_t chunk_size_hint = 0;
};

/**
 * @brief Parsed Content-Range header
 *
 * "bytes 0-4194303/10485760" or, for a status probe, "bytes * /10485760"
 * (written without the space).
 */
struct ByteRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;
    std::uint64_t total = 0;
    bool probe = false;

    std::uint64_t length() const { return probe ? 0 : last - first + 1; }
};

/// InvalidRange for anything but the two forms above, or first > last.
Result<ByteRange> parse_content_range(const std::string& header);

struct ChunkOutcome {
    enum class Kind {
        Accepted,    // Bytes committed, more expected
        Resume,      // Nothing written; continue from next_offset
        Complete     // Blob finalized as origin_file_id
    };

    Kind kind = Kind::Accepted;
    std::uint64_t next_offset = 0;
    std::string origin_file_id;

    static ChunkOutcome accepted(std::uint64_t next) { return {Kind::Accepted, next, {}}; }
    static ChunkOutcome resume(std::uint64_t next) { return {Kind::Resume, next, {}}; }
    static ChunkOutcome complete(std::uint64_t total, std::string id) {
        return {Kind::Complete, total, std::move(id)};
    }
};

class SessionManager {
public:
    SessionManager(config::UploadConfig config,
                   storage::BlobStore& store,
                   IntakeStateStore& state,
                   const ContributorRegistry& contributors,
                   events::EventBus* bus = nullptr);

    /**
     * @brief Open an upload session
     *
     * Errors: InvalidToken, FileTooLarge, InvalidArgument (empty name or
     * zero size), UnknownBatch, BatchFinalized. Nothing is persisted on
     * failure.
     */
    Result<InitUploadResponse> init_upload(const InitUploadRequest& request);

    /**
     * @brief Accept one chunk
     *
     * A blob store failure while appending comes back as Transient with the
     * committed offset unchanged; the client retries the same chunk.
     */
    Result<ChunkOutcome> put_chunk(const std::string& session_id, const ByteRange& range,
                                   const std::uint8_t* data, std::size_t size);

    /// Ask the blob store how many bytes it holds and answer Resume.
    Result<ChunkOutcome> probe(const std::string& session_id);

    /**
     * @brief Abort sessions idle for longer than session_ttl_seconds
     *
     * RETURNS:
     * Number of sessions dropped.
     */
    std::size_t reap_expired(std::time_t now);

    Result<std::size_t> active_sessions();

    const config::UploadConfig& config() const { return config_; }

private:
    std::shared_ptr<std::mutex> lock_for(const std::string& session_id);
    void release_lock(const std::string& session_id);

    Result<model::UploadSession> load_session(const std::string& session_id);

    /// Adopt the remote offset; finalizes if it already covers the file.
    Result<ChunkOutcome> resync(model::UploadSession& session, bool explicit_probe);

    Result<ChunkOutcome> complete(model::UploadSession& session);

    config::UploadConfig config_;
    storage::BlobStore& store_;
    IntakeStateStore& state_;
    const ContributorRegistry& contributors_;
    events::EventBus* bus_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_locks_;
};

} // namespace vault::intake
