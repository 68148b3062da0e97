#include "vault/pipeline/dedup.hpp"

#include "vault/pipeline/fingerprint.hpp"

#include <spdlog/spdlog.h>

namespace vault::pipeline {

DedupResolver::DedupResolver(const FingerprintIndex& index, int phash_threshold)
    : index_(index)
    , phash_threshold_(phash_threshold) {
}

Result<DedupOutcome> DedupResolver::resolve(const DedupCandidate& candidate) const {
    DedupOutcome outcome;

    auto order = index_.claim_order(candidate.asset_id);
    if (order.is_error()) {
        return Err<DedupOutcome>(order.error());
    }
    const auto candidate_order = order.value();

    auto exact = index_.find_by_sha256(candidate.sha256);
    if (exact.is_error()) {
        return Err<DedupOutcome>(exact.error());
    }

    const FingerprintRecord* best = nullptr;
    for (const auto& record : exact.value()) {
        if (eligible(record, candidate, candidate_order) && (best == nullptr || earlier(record, *best))) {
            best = &record;
        }
    }
    if (best != nullptr) {
        outcome.duplicate_of = best->asset_id;
        outcome.method = model::DuplicateMethod::Exact;
        outcome.distance = 0;
        return Ok(outcome);
    }

    if (!candidate.phash) {
        return Ok(outcome);
    }

    auto near = index_.with_phash();
    if (near.is_error()) {
        return Err<DedupOutcome>(near.error());
    }

    int best_distance = phash_threshold_ + 1;
    for (const auto& record : near.value()) {
        if (!eligible(record, candidate, candidate_order) || !record.phash) {
            continue;
        }
        const int distance = hamming_distance(*candidate.phash, *record.phash);
        if (distance < 0) {
            spdlog::warn("Ignoring malformed phash on asset {}", record.asset_id);
            continue;
        }
        if (distance > phash_threshold_) {
            continue;
        }
        if (best == nullptr || distance < best_distance ||
            (distance == best_distance && earlier(record, *best))) {
            best = &record;
            best_distance = distance;
        }
    }

    if (best != nullptr) {
        outcome.duplicate_of = best->asset_id;
        outcome.method = model::DuplicateMethod::Near;
        outcome.distance = best_distance;
    }
    return Ok(outcome);
}

bool DedupResolver::eligible(const FingerprintRecord& record, const DedupCandidate& candidate,
                             std::optional<std::int64_t> candidate_order) {
    if (record.asset_id == candidate.asset_id || record.status == model::AssetStatus::Error) {
        return false;
    }
    return !candidate_order || record.claim_order < *candidate_order;
}

bool DedupResolver::earlier(const FingerprintRecord& a, const FingerprintRecord& b) {
    if (a.created_at != b.created_at) {
        return a.created_at < b.created_at;
    }
    if (a.claim_order != b.claim_order) {
        return a.claim_order < b.claim_order;
    }
    return a.asset_id < b.asset_id;
}

} // namespace vault::pipeline
