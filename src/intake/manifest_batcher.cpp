#include "vault/intake/manifest_batcher.hpp"

#include "vault/core/ids.hpp"
#include "vault/events/events.hpp"
#include "vault/model/json.hpp"

#include <spdlog/spdlog.h>

namespace vault::intake {

ManifestBatcher::ManifestBatcher(config::BatchConfig config,
                                 storage::BlobStore& store,
                                 IntakeStateStore& state,
                                 const ContributorRegistry& contributors,
                                 events::EventBus* bus)
    : config_(config)
    , store_(store)
    , state_(state)
    , contributors_(contributors)
    , bus_(bus) {
}

std::string ManifestBatcher::make_batch_id(std::time_t now) {
    return "batch_" + format_compact_timestamp(now) + "_" + random_hex(8);
}

Result<std::string> ManifestBatcher::create_batch(const std::string& contributor_token) {
    if (!contributors_.is_valid(contributor_token)) {
        return fail<std::string>(ErrorCode::InvalidToken, "unknown contributor token");
    }

    model::PendingBatch batch;
    batch.created_at = std::time(nullptr);
    batch.contributor_token = contributor_token;
    batch.batch_id = make_batch_id(batch.created_at);

    auto created = state_.create_batch(batch);
    if (created.is_error()) {
        return Err<std::string>(created.error());
    }

    if (bus_ != nullptr) {
        bus_->emit(events::BatchCreatedEvent{batch.batch_id, contributor_token});
    }
    return Ok(batch.batch_id);
}

Result<FinishBatchAck> ManifestBatcher::finish_batch(const FinishBatchRequest& request) {
    if (!contributors_.is_valid(request.contributor_token)) {
        return fail<FinishBatchAck>(ErrorCode::InvalidToken, "unknown contributor token");
    }

    std::lock_guard lock(finish_mutex_);

    auto found = state_.get_batch(request.batch_id);
    if (found.is_error()) {
        return Err<FinishBatchAck>(found.error());
    }
    if (!found.value() || found.value()->contributor_token != request.contributor_token) {
        return fail<FinishBatchAck>(ErrorCode::UnknownBatch, "no batch " + request.batch_id);
    }
    const model::PendingBatch& batch = *found.value();
    if (batch.finalized) {
        return fail<FinishBatchAck>(ErrorCode::BatchFinalized, "batch " + request.batch_id + " already finished");
    }

    model::Manifest manifest;
    manifest.batch_id = batch.batch_id;
    manifest.contributor_token = batch.contributor_token;
    manifest.contributor_name = contributors_.display_name(batch.contributor_token).value_or("");
    manifest.created_at = batch.created_at;
    manifest.finished_at = std::time(nullptr);
    manifest.context = request.context;
    manifest.files = request.files.empty() ? batch.files : request.files;

    if (manifest.files.size() > config_.max_files) {
        return fail<FinishBatchAck>(ErrorCode::TooManyFiles,
            std::to_string(manifest.files.size()) + " files exceed the batch limit of " +
            std::to_string(config_.max_files));
    }

    const std::string body = model::to_json(manifest).dump(2);
    auto written = store_.upload(storage::Location::Manifests, manifest.batch_id + ".json",
                                 std::vector<std::uint8_t>(body.begin(), body.end()),
                                 "application/json");
    if (written.is_error()) {
        return fail<FinishBatchAck>(ErrorCode::Transient, "manifest upload failed: " + written.error().message);
    }

    auto finalized = state_.finalize_batch(manifest.batch_id);
    if (finalized.is_error()) {
        // The manifest is already out; the worker will reconcile it regardless
        spdlog::error("Batch {} written as {} but not marked finalized: {}", manifest.batch_id,
                      written.value(), finalized.error().message);
    }

    if (bus_ != nullptr) {
        bus_->emit(events::BatchFinishedEvent{manifest.batch_id, written.value(),
                                              manifest.files.size(), manifest.total_bytes()});
    }

    return Ok(FinishBatchAck{manifest.batch_id, written.value(), manifest.files.size()});
}

} // namespace vault::intake
