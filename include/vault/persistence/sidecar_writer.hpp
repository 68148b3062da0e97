#pragma once

#include "vault/core/result.hpp"
#include "vault/model/types.hpp"
#include "vault/storage/blob_store.hpp"

#include <filesystem>
#include <string>

namespace vault::persistence {

struct SidecarRef {
    std::filesystem::path local_path;
    std::string blob_id;                 // Empty when no blob store is attached
};

/**
 * @brief Writes the per-asset sidecar document
 *
 * The local copy at <sidecar_dir>/<asset_id>.json is replaced atomically
 * (write to .tmp, then rename). A copy is also uploaded to the sidecars
 * location when a blob store is attached; once the upload lands, earlier
 * sidecar blobs for the same asset are removed, so the location holds one
 * <asset_id>.json per asset.
 */
class SidecarWriter {
public:
    explicit SidecarWriter(std::filesystem::path sidecar_dir, storage::BlobStore* store = nullptr);

    Result<SidecarRef> write(const model::Asset& asset, const model::EnrichmentResult& enrichment);

    std::filesystem::path path_for(const std::string& asset_id) const;

private:
    void remove_stale_blobs(const std::string& name, const std::string& keep_id);

    std::filesystem::path sidecar_dir_;
    storage::BlobStore* store_;
};

} // namespace vault::persistence
