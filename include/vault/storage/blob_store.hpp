#pragma once

/**
 * @file blob_store.hpp
 * @brief Object store collaborator holding every uploaded byte
 *
 * WHY THIS FILE EXISTS:
 * The intake server and the worker never touch storage paths directly.
 * Blobs live in named locations (inbox, processing, holding folders) and
 * move between them as the pipeline routes them. Uploads arrive through
 * resumable sessions so a dropped connection never loses acknowledged
 * bytes.
 *
 * IMPLEMENTATIONS:
 * - LocalBlobStore: directories on local disk
 * - Tests wrap it to inject transient failures
 */

#include "vault/core/result.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vault::storage {

enum class Location {
    Inbox,
    Manifests,
    Processing,
    NeedsReview,
    PossibleDuplicates,
    TranscribeLater,
    Sidecars
};

/// Folder name of a location, e.g. "holding/needs_review".
std::string to_string(Location location);
std::optional<Location> location_from_string(const std::string& text);

/// Every location, in declaration order.
const std::vector<Location>& all_locations();

struct BlobInfo {
    std::string id;
    std::string name;
    std::string mime_type;
    std::uint64_t size_bytes = 0;
    Location location = Location::Inbox;
    std::time_t created_at = 0;
};

struct ResumableMeta {
    std::string name;
    std::string mime_type;
    std::uint64_t total_bytes = 0;
    Location location = Location::Inbox;
};

class BlobStore {
public:
    virtual ~BlobStore() = default;

    /// Store @p bytes as a new blob. Returns the blob id.
    virtual Result<std::string> upload(Location location, const std::string& name,
                                       const std::vector<std::uint8_t>& bytes,
                                       const std::string& mime_type) = 0;

    /// Copy blob contents to a local file, replacing it if present.
    virtual Result<void> download(const std::string& id, const std::filesystem::path& dest) = 0;

    virtual Result<void> move(const std::string& id, Location location) = 0;

    virtual Result<std::vector<BlobInfo>> list(Location location) = 0;

    virtual Result<BlobInfo> stat(const std::string& id) = 0;

    virtual Result<std::vector<std::uint8_t>> read(const std::string& id) = 0;

    /// Delete a blob. NotFound when no location holds @p id.
    virtual Result<void> remove(const std::string& id) = 0;

    // ────────────────────────────────────────────────────────
    // Resumable sessions
    // ────────────────────────────────────────────────────────

    /// Open a session; the returned handle is opaque to callers.
    virtual Result<std::string> create_resumable_session(const ResumableMeta& meta) = 0;

    /**
     * @brief Append bytes at @p offset
     *
     * @p offset must equal query_received_bytes(); anything else is
     * InvalidRange. Transient means nothing was committed.
     */
    virtual Result<void> append_range(const std::string& handle, std::uint64_t offset,
                                      const std::uint8_t* data, std::size_t size) = 0;

    virtual Result<std::uint64_t> query_received_bytes(const std::string& handle) = 0;

    /// Turn a fully received session into a blob. Returns the blob id.
    virtual Result<std::string> finalize_resumable(const std::string& handle) = 0;

    virtual Result<void> abort_resumable(const std::string& handle) = 0;
};

} // namespace vault::storage
