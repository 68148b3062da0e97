#pragma once

#include "vault/storage/blob_store.hpp"

#include <filesystem>
#include <mutex>

namespace vault::storage {

/**
 * @brief BlobStore on a local directory tree
 *
 * Layout:
 *   <root>/<location>/<id>        blob bytes
 *   <root>/<location>/<id>.json   {name, mime_type, created_at}
 *   <root>/.resumable/<handle>.part / .json
 *
 * Finalize renames the staged part into its location, so a blob is either
 * complete or absent.
 */
class LocalBlobStore : public BlobStore {
public:
    explicit LocalBlobStore(std::filesystem::path root);

    /// Create every location directory.
    Result<void> initialize();

    Result<std::string> upload(Location location, const std::string& name,
                               const std::vector<std::uint8_t>& bytes,
                               const std::string& mime_type) override;
    Result<void> download(const std::string& id, const std::filesystem::path& dest) override;
    Result<void> move(const std::string& id, Location location) override;
    Result<std::vector<BlobInfo>> list(Location location) override;
    Result<BlobInfo> stat(const std::string& id) override;
    Result<std::vector<std::uint8_t>> read(const std::string& id) override;
    Result<void> remove(const std::string& id) override;

    Result<std::string> create_resumable_session(const ResumableMeta& meta) override;
    Result<void> append_range(const std::string& handle, std::uint64_t offset,
                              const std::uint8_t* data, std::size_t size) override;
    Result<std::uint64_t> query_received_bytes(const std::string& handle) override;
    Result<std::string> finalize_resumable(const std::string& handle) override;
    Result<void> abort_resumable(const std::string& handle) override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path location_dir(Location location) const;
    std::filesystem::path staging_dir() const;

    Result<BlobInfo> find_locked(const std::string& id) const;
    Result<void> write_meta(const std::filesystem::path& path, const BlobInfo& info) const;
    Result<BlobInfo> read_meta(const std::filesystem::path& path, Location location) const;
    Result<ResumableMeta> read_session_meta(const std::string& handle) const;

    static bool valid_id(const std::string& id);
    static Result<void> ensure_dir(const std::filesystem::path& path);

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

} // namespace vault::storage
