#pragma once

/**
 * @file intake_api.hpp
 * @brief HTTP routes of the intake server
 *
 * ROUTES:
 *   POST /upload/init     {contributorToken, filename, sizeBytes, mimeType, batchID?}
 *   PUT  /upload/chunk    X-Upload-Session-ID + Content-Range, raw body
 *   POST /batch/create    {contributorToken}
 *   POST /batch/finish    {contributorToken, batchID, files[], context}
 *   GET  /health
 *   GET  /ops/stats
 *
 * Chunk answers follow the resumable-upload convention: 308 with
 * "Range: bytes=0-<n-1>" while incomplete, 200 with originFileID when done.
 */

#include "vault/core/error.hpp"
#include "vault/intake/manifest_batcher.hpp"
#include "vault/intake/session_manager.hpp"
#include "vault/network/http_router.hpp"
#include "vault/persistence/asset_repository.hpp"

#include <filesystem>
#include <string>

namespace vault::intake {

class IntakeApi {
public:
    /**
     * @param assets Metadata store for /ops/stats; null leaves counts out
     * @param disk_path Filesystem whose free space /ops/stats reports
     */
    IntakeApi(SessionManager& sessions,
              ManifestBatcher& batcher,
              const persistence::AssetRepository* assets = nullptr,
              std::filesystem::path disk_path = {});

    void register_routes(network::HttpRouter& router);

    network::HttpResponse handle_init(const network::HttpContext& ctx);
    network::HttpResponse handle_chunk(const network::HttpContext& ctx);
    network::HttpResponse handle_batch_create(const network::HttpContext& ctx);
    network::HttpResponse handle_batch_finish(const network::HttpContext& ctx);
    network::HttpResponse handle_health(const network::HttpContext& ctx);
    network::HttpResponse handle_ops_stats(const network::HttpContext& ctx);

    static network::HttpStatus status_for(ErrorCode code);
    static network::HttpResponse error_response(const Error& error);

private:
    SessionManager& sessions_;
    ManifestBatcher& batcher_;
    const persistence::AssetRepository* assets_;
    std::filesystem::path disk_path_;
};

} // namespace vault::intake
