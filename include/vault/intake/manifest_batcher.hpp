#pragma once

#include "vault/config/config.hpp"
#include "vault/core/result.hpp"
#include "vault/events/event_bus.hpp"
#include "vault/intake/contributors.hpp"
#include "vault/intake/state_store.hpp"
#include "vault/model/types.hpp"
#include "vault/storage/blob_store.hpp"

#include <ctime>
#include <mutex>
#include <string>
#include <vector>

namespace vault::intake {

struct FinishBatchRequest {
    std::string contributor_token;
    std::string batch_id;
    std::vector<model::ManifestFile> files;   // Empty: use the files recorded during upload
    model::BatchContext context;
};

struct FinishBatchAck {
    std::string batch_id;
    std::string manifest_id;
    std::size_t total_files = 0;
};

/**
 * @brief Groups uploads into batches and writes one manifest per batch
 *
 * The manifest lands in the manifests location as <batch_id>.json and is
 * never rewritten. Finishing is serialized so two concurrent finish calls
 * cannot both write a manifest.
 */
class ManifestBatcher {
public:
    ManifestBatcher(config::BatchConfig config,
                    storage::BlobStore& store,
                    IntakeStateStore& state,
                    const ContributorRegistry& contributors,
                    events::EventBus* bus = nullptr);

    Result<std::string> create_batch(const std::string& contributor_token);

    /**
     * @brief Write the manifest for an open batch
     *
     * Errors: InvalidToken, UnknownBatch (missing or owned by another
     * contributor), TooManyFiles, BatchFinalized.
     */
    Result<FinishBatchAck> finish_batch(const FinishBatchRequest& request);

    /// "batch_<YYYYMMDD_HHMMSS>_<8 hex>" in UTC.
    static std::string make_batch_id(std::time_t now);

private:
    config::BatchConfig config_;
    storage::BlobStore& store_;
    IntakeStateStore& state_;
    const ContributorRegistry& contributors_;
    events::EventBus* bus_;
    std::mutex finish_mutex_;
};

} // namespace vault::intake
