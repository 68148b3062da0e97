#pragma once

#include "vault/core/result.hpp"
#include "vault/model/types.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace vault::pipeline {

/// Fingerprint columns of a stored asset.
struct FingerprintRecord {
    std::string asset_id;
    std::string sha256;
    std::optional<std::string> phash;
    model::AssetStatus status = model::AssetStatus::Uploaded;
    std::time_t created_at = 0;
    std::int64_t claim_order = 0;   // increases with every claimed asset
};

/**
 * @brief Read side of the asset store used for duplicate lookup
 *
 * Implemented by persistence::AssetRepository.
 */
class FingerprintIndex {
public:
    virtual ~FingerprintIndex() = default;

    virtual Result<std::vector<FingerprintRecord>> find_by_sha256(const std::string& sha256) const = 0;

    /// Every asset whose phash is set.
    virtual Result<std::vector<FingerprintRecord>> with_phash() const = 0;

    /// Claim order of @p asset_id; nullopt when it was never claimed.
    virtual Result<std::optional<std::int64_t>> claim_order(const std::string& asset_id) const = 0;
};

struct DedupCandidate {
    std::string asset_id;
    std::string sha256;
    std::optional<std::string> phash;
};

struct DedupOutcome {
    std::optional<std::string> duplicate_of;
    model::DuplicateMethod method = model::DuplicateMethod::Exact;
    int distance = 0;

    bool is_duplicate() const { return duplicate_of.has_value(); }
};

/**
 * @brief Decides whether a fingerprinted asset repeats an earlier one
 *
 * Order of checks:
 * 1. Exact: the earliest created asset with the same sha256
 * 2. Near: only when the candidate has a phash; the stored phash with the
 *    smallest Hamming distance, provided it is <= threshold. Equal
 *    distances go to the earliest created_at, then the smallest asset_id.
 *
 * Only assets claimed before the candidate are matched, so a retried
 * asset never points at a copy that arrived while it sat in error. The
 * candidate itself and assets in status error are never matched either.
 * The near scan is linear over every stored phash.
 */
class DedupResolver {
public:
    DedupResolver(const FingerprintIndex& index, int phash_threshold);

    Result<DedupOutcome> resolve(const DedupCandidate& candidate) const;

    int threshold() const { return phash_threshold_; }

private:
    static bool eligible(const FingerprintRecord& record, const DedupCandidate& candidate,
                         std::optional<std::int64_t> candidate_order);
    static bool earlier(const FingerprintRecord& a, const FingerprintRecord& b);

    const FingerprintIndex& index_;
    int phash_threshold_;
};

} // namespace vault::pipeline
