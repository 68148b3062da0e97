#pragma once

#include "vault/core/result.hpp"
#include "vault/model/types.hpp"
#include "vault/pipeline/dedup.hpp"
#include "vault/storage/blob_store.hpp"

#include <optional>
#include <string>

namespace vault::pipeline {

struct RoutingInput {
    model::MediaKind media = model::MediaKind::Other;
    DedupOutcome dedup;
    bool transcription_deferred = false;
    /// Set when download, hashing or persistence failed.
    std::optional<std::string> failure;
};

struct RoutingDecision {
    model::AssetStatus status = model::AssetStatus::NeedsReview;
    storage::Location location = storage::Location::NeedsReview;
    bool create_duplicate_link = false;
};

/**
 * @brief Choose the holding state for a processed asset
 *
 * Precedence: failure, duplicate, deferred transcription (video/audio
 * only), needs review. Failed assets stay in the processing location.
 */
RoutingDecision route(const RoutingInput& input);

/// Legal status changes; re-entering processing from a holding state is not.
bool can_transition(model::AssetStatus from, model::AssetStatus to) noexcept;

/**
 * @brief Move @p asset to @p target if the transition table allows it
 *
 * A transition to the current status is a no-op.
 */
Result<void> transition(model::Asset& asset, model::AssetStatus target);

/// Holding location for a status, nullopt for non-holding states.
std::optional<storage::Location> location_for(model::AssetStatus status);

} // namespace vault::pipeline
