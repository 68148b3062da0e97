#include "vault/pipeline/routing.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace vault::pipeline {

using model::AssetStatus;

namespace {

bool is_holding(AssetStatus status) {
    return status == AssetStatus::NeedsReview ||
           status == AssetStatus::PossibleDuplicate ||
           status == AssetStatus::TranscribeLater;
}

} // namespace

RoutingDecision route(const RoutingInput& input) {
    RoutingDecision decision;

    if (input.failure) {
        decision.status = AssetStatus::Error;
        decision.location = storage::Location::Processing;
        return decision;
    }

    if (input.dedup.is_duplicate()) {
        decision.status = AssetStatus::PossibleDuplicate;
        decision.location = storage::Location::PossibleDuplicates;
        decision.create_duplicate_link = true;
        return decision;
    }

    const bool timed_media = input.media == model::MediaKind::Video || input.media == model::MediaKind::Audio;
    if (timed_media && input.transcription_deferred) {
        decision.status = AssetStatus::TranscribeLater;
        decision.location = storage::Location::TranscribeLater;
        return decision;
    }

    decision.status = AssetStatus::NeedsReview;
    decision.location = storage::Location::NeedsReview;
    return decision;
}

bool can_transition(AssetStatus from, AssetStatus to) noexcept {
    static const std::unordered_map<AssetStatus, std::vector<AssetStatus>> transitions {
        {AssetStatus::Uploaded, {AssetStatus::Processing}},
        {AssetStatus::Processing, {AssetStatus::NeedsReview, AssetStatus::PossibleDuplicate,
                                   AssetStatus::TranscribeLater, AssetStatus::Error}},
        {AssetStatus::Error, {AssetStatus::Processing}},
    };

    if (is_holding(from)) {
        return to == AssetStatus::Approved || to == AssetStatus::Archived || to == AssetStatus::Rejected;
    }

    const auto it = transitions.find(from);
    if (it == transitions.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), to) != it->second.end();
}

Result<void> transition(model::Asset& asset, AssetStatus target) {
    if (asset.status == target) {
        return Ok();
    }
    if (!can_transition(asset.status, target)) {
        return Err<void>(Error(ErrorCode::InvalidArgument,
                               "illegal status transition " + model::to_string(asset.status) +
                               " -> " + model::to_string(target)));
    }
    asset.status = target;
    return Ok();
}

std::optional<storage::Location> location_for(AssetStatus status) {
    switch (status) {
        case AssetStatus::NeedsReview: return storage::Location::NeedsReview;
        case AssetStatus::PossibleDuplicate: return storage::Location::PossibleDuplicates;
        case AssetStatus::TranscribeLater: return storage::Location::TranscribeLater;
        case AssetStatus::Processing:
        case AssetStatus::Error: return storage::Location::Processing;
        default: return std::nullopt;
    }
}

} // namespace vault::pipeline
