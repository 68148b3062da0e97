#pragma once

/**
 * @file json.hpp
 * @brief JSON documents exchanged with clients and written to the blob store
 *
 * Manifests and sidecars are the two persisted document kinds. Both use
 * snake_case keys. Client payloads arrive in camelCase; the readers here
 * accept either spelling so the HTTP layer does not need a second codec.
 */

#include "vault/core/result.hpp"
#include "vault/model/types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace vault {
namespace model {

using json = nlohmann::json;

/// Version stamped into every sidecar document.
constexpr int kSidecarSchemaVersion = 1;

json to_json(const BatchContext& context);

/**
 * @brief Read a batch context
 *
 * A numeric decade (1980) is normalized to its label ("1980s").
 */
BatchContext context_from_json(const json& j);

json to_json(const ManifestFile& file);
Result<ManifestFile> manifest_file_from_json(const json& j);
Result<std::vector<ManifestFile>> manifest_files_from_json(const json& j);

json to_json(const Manifest& manifest);
Result<Manifest> manifest_from_json(const json& j);

/**
 * @brief Full denormalized snapshot of an asset and its enrichment outputs
 */
json sidecar_json(const Asset& asset, const EnrichmentResult& enrichment);

json to_json(const DetectedFace& face);
json to_json(const TranscriptSegment& segment);

} // namespace model
} // namespace vault
