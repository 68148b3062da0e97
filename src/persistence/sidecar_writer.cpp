#include "vault/persistence/sidecar_writer.hpp"

#include "vault/model/json.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace vault::persistence {
namespace fs = std::filesystem;

SidecarWriter::SidecarWriter(fs::path sidecar_dir, storage::BlobStore* store)
    : sidecar_dir_(std::move(sidecar_dir))
    , store_(store) {
}

fs::path SidecarWriter::path_for(const std::string& asset_id) const {
    return sidecar_dir_ / (asset_id + ".json");
}

Result<SidecarRef> SidecarWriter::write(const model::Asset& asset, const model::EnrichmentResult& enrichment) {
    std::error_code ec;
    fs::create_directories(sidecar_dir_, ec);
    if (ec) {
        return fail<SidecarRef>(ErrorCode::Io, "create " + sidecar_dir_.string() + ": " + ec.message());
    }

    const std::string body = model::sidecar_json(asset, enrichment).dump(2);

    SidecarRef ref;
    ref.local_path = path_for(asset.asset_id);
    const fs::path tmp = ref.local_path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return fail<SidecarRef>(ErrorCode::Io, "open " + tmp.string());
        }
        out << body;
        if (!out) {
            return fail<SidecarRef>(ErrorCode::Io, "write " + tmp.string());
        }
    }
    fs::rename(tmp, ref.local_path, ec);
    if (ec) {
        return fail<SidecarRef>(ErrorCode::Io, "rename " + tmp.string() + ": " + ec.message());
    }

    if (store_ != nullptr) {
        std::vector<std::uint8_t> bytes(body.begin(), body.end());
        auto uploaded = store_->upload(storage::Location::Sidecars, asset.asset_id + ".json",
                                       bytes, "application/json");
        if (uploaded.is_error()) {
            return Err<SidecarRef>(uploaded.error());
        }
        ref.blob_id = uploaded.value();
        remove_stale_blobs(asset.asset_id + ".json", ref.blob_id);
    }

    spdlog::debug("Sidecar written: asset={} path={} blob={}", asset.asset_id, ref.local_path.string(), ref.blob_id);
    return Ok(ref);
}

void SidecarWriter::remove_stale_blobs(const std::string& name, const std::string& keep_id) {
    auto listed = store_->list(storage::Location::Sidecars);
    if (listed.is_error()) {
        spdlog::warn("Could not list sidecars to replace {}: {}", name, listed.error().message);
        return;
    }
    for (const auto& blob : listed.value()) {
        if (blob.name != name || blob.id == keep_id) {
            continue;
        }
        auto removed = store_->remove(blob.id);
        if (removed.is_error()) {
            spdlog::warn("Stale sidecar blob {} for {} not removed: {}", blob.id, name, removed.error().message);
        }
    }
}

} // namespace vault::persistence
