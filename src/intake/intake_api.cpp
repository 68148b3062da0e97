#include "vault/intake/intake_api.hpp"

#include "vault/model/json.hpp"
#include "vault/pipeline/backpressure.hpp"

#include <spdlog/spdlog.h>

#include <initializer_list>

namespace vault::intake {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
using json = nlohmann::json;

namespace {

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

Result<json> parse_body(const HttpContext& ctx) {
    try {
        json body = json::parse(ctx.request.body_as_string());
        if (!body.is_object()) {
            return fail<json>(ErrorCode::InvalidArgument, "request body must be a JSON object");
        }
        return Ok(body);
    } catch (const json::parse_error& e) {
        return fail<json>(ErrorCode::InvalidArgument, std::string("invalid JSON: ") + e.what());
    }
}

std::string text_field(const json& body, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = body.find(key);
        if (it != body.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return {};
}

HttpResponse chunk_response(const ChunkOutcome& outcome) {
    if (outcome.kind == ChunkOutcome::Kind::Complete) {
        return json_response(HttpStatus::OK, json{{"originFileID", outcome.origin_file_id}});
    }
    auto response = json_response(HttpStatus::PERMANENT_REDIRECT, json{{"nextOffset", outcome.next_offset}});
    if (outcome.next_offset > 0) {
        response.set_header("Range", "bytes=0-" + std::to_string(outcome.next_offset - 1));
    }
    return response;
}

} // namespace

IntakeApi::IntakeApi(SessionManager& sessions,
                     ManifestBatcher& batcher,
                     const persistence::AssetRepository* assets,
                     std::filesystem::path disk_path)
    : sessions_(sessions)
    , batcher_(batcher)
    , assets_(assets)
    , disk_path_(std::move(disk_path)) {
}

void IntakeApi::register_routes(network::HttpRouter& router) {
    router.post("/upload/init", [this](const HttpContext& ctx) { return handle_init(ctx); });
    router.put("/upload/chunk", [this](const HttpContext& ctx) { return handle_chunk(ctx); });
    router.post("/batch/create", [this](const HttpContext& ctx) { return handle_batch_create(ctx); });
    router.post("/batch/finish", [this](const HttpContext& ctx) { return handle_batch_finish(ctx); });
    router.get("/health", [this](const HttpContext& ctx) { return handle_health(ctx); });
    router.get("/ops/stats", [this](const HttpContext& ctx) { return handle_ops_stats(ctx); });
}

HttpStatus IntakeApi::status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return HttpStatus::BAD_REQUEST;
        case ErrorCode::InvalidToken: return HttpStatus::UNAUTHORIZED;
        case ErrorCode::FileTooLarge: return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorCode::TooManyFiles: return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorCode::UnknownSession: return HttpStatus::NOT_FOUND;
        case ErrorCode::UnknownBatch: return HttpStatus::NOT_FOUND;
        case ErrorCode::NotFound: return HttpStatus::NOT_FOUND;
        case ErrorCode::BatchFinalized: return HttpStatus::CONFLICT;
        case ErrorCode::AlreadyExists: return HttpStatus::CONFLICT;
        case ErrorCode::InvalidRange: return HttpStatus::RANGE_NOT_SATISFIABLE;
        case ErrorCode::Transient: return HttpStatus::SERVICE_UNAVAILABLE;
        case ErrorCode::Io:
        case ErrorCode::Storage:
        case ErrorCode::Internal:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse IntakeApi::error_response(const Error& error) {
    const HttpStatus status = status_for(error.code);
    if (status == HttpStatus::INTERNAL_SERVER_ERROR) {
        spdlog::error("Request failed: {}", to_string(error));
    }
    auto response = json_response(status, json{
        {"error", error_code_name(error.code)},
        {"message", error.message}
    });
    if (status == HttpStatus::SERVICE_UNAVAILABLE) {
        response.set_header("Retry-After", "1");
    }
    return response;
}

HttpResponse IntakeApi::handle_init(const HttpContext& ctx) {
    auto body = parse_body(ctx);
    if (body.is_error()) {
        return error_response(body.error());
    }
    const json& j = body.value();

    InitUploadRequest request;
    request.contributor_token = text_field(j, {"contributorToken", "contributor_token"});
    request.filename = text_field(j, {"filename", "fileName"});
    request.mime_type = text_field(j, {"mimeType", "mime_type"});

    auto size = j.find("sizeBytes");
    if (size == j.end()) {
        size = j.find("size_bytes");
    }
    if (size == j.end() || !size->is_number_integer() || size->get<long long>() < 0) {
        return error_response(Error(ErrorCode::InvalidArgument, "sizeBytes must be a non-negative integer"));
    }
    request.size_bytes = size->get<std::uint64_t>();

    const std::string batch_id = text_field(j, {"batchID", "batchId", "batch_id"});
    if (!batch_id.empty()) {
        request.batch_id = batch_id;
    }

    auto result = sessions_.init_upload(request);
    if (result.is_error()) {
        return error_response(result.error());
    }
    return json_response(HttpStatus::OK, json{
        {"sessionID", result.value().session_id},
        {"chunkSizeHint", result.value().chunk_size_hint}
    });
}

HttpResponse IntakeApi::handle_chunk(const HttpContext& ctx) {
    const std::string session_id = ctx.request.get_header("X-Upload-Session-ID");
    if (session_id.empty()) {
        return error_response(Error(ErrorCode::InvalidArgument, "X-Upload-Session-ID header is required"));
    }

    const auto& payload = ctx.request.body;
    const std::string header = ctx.request.get_header("Content-Range");
    if (header.empty()) {
        if (!payload.empty()) {
            return error_response(Error(ErrorCode::InvalidArgument, "Content-Range header is required"));
        }
        auto outcome = sessions_.probe(session_id);
        if (outcome.is_error()) {
            return error_response(outcome.error());
        }
        return chunk_response(outcome.value());
    }

    auto range = parse_content_range(header);
    if (range.is_error()) {
        // Unparsable header is a client bug, not an unsatisfiable range
        return error_response(Error(ErrorCode::InvalidArgument, range.error().message));
    }

    auto outcome = sessions_.put_chunk(session_id, range.value(), payload.data(), payload.size());
    if (outcome.is_error()) {
        return error_response(outcome.error());
    }
    return chunk_response(outcome.value());
}

HttpResponse IntakeApi::handle_batch_create(const HttpContext& ctx) {
    auto body = parse_body(ctx);
    if (body.is_error()) {
        return error_response(body.error());
    }

    auto batch_id = batcher_.create_batch(text_field(body.value(), {"contributorToken", "contributor_token"}));
    if (batch_id.is_error()) {
        return error_response(batch_id.error());
    }
    return json_response(HttpStatus::OK, json{{"batchID", batch_id.value()}});
}

HttpResponse IntakeApi::handle_batch_finish(const HttpContext& ctx) {
    auto body = parse_body(ctx);
    if (body.is_error()) {
        return error_response(body.error());
    }
    const json& j = body.value();

    FinishBatchRequest request;
    request.contributor_token = text_field(j, {"contributorToken", "contributor_token"});
    request.batch_id = text_field(j, {"batchID", "batchId", "batch_id"});
    if (request.batch_id.empty()) {
        return error_response(Error(ErrorCode::InvalidArgument, "batchID is required"));
    }

    auto files_it = j.find("files");
    if (files_it != j.end()) {
        auto files = model::manifest_files_from_json(*files_it);
        if (files.is_error()) {
            return error_response(files.error());
        }
        request.files = std::move(files.value());
    }

    auto context_it = j.find("context");
    if (context_it != j.end() && context_it->is_object()) {
        request.context = model::context_from_json(*context_it);
    }

    auto ack = batcher_.finish_batch(request);
    if (ack.is_error()) {
        return error_response(ack.error());
    }
    return json_response(HttpStatus::OK, json{
        {"ack", true},
        {"batchID", ack.value().batch_id},
        {"manifestID", ack.value().manifest_id},
        {"totalProcessedCount", ack.value().total_files}
    });
}

HttpResponse IntakeApi::handle_health(const HttpContext&) {
    auto active = sessions_.active_sessions();
    if (active.is_error()) {
        return json_response(HttpStatus::SERVICE_UNAVAILABLE, json{
            {"status", "degraded"},
            {"message", active.error().message}
        });
    }
    return json_response(HttpStatus::OK, json{
        {"status", "ok"},
        {"activeSessions", active.value()}
    });
}

HttpResponse IntakeApi::handle_ops_stats(const HttpContext&) {
    json stats = json::object();

    if (assets_ != nullptr) {
        auto counts = assets_->count_by_status();
        if (counts.is_error()) {
            return error_response(counts.error());
        }
        json backlog = json::object();
        for (const auto& [status, count] : counts.value()) {
            backlog[status] = count;
        }
        stats["backlog"] = backlog;

        auto last_run = assets_->get_state("last_worker_run");
        if (last_run.is_error()) {
            return error_response(last_run.error());
        }
        stats["last_worker_run"] = last_run.value() ? json(*last_run.value()) : json(nullptr);
    }

    if (!disk_path_.empty()) {
        auto free_bytes = pipeline::filesystem_free_bytes(disk_path_);
        stats["disk_free_bytes"] = free_bytes.is_ok() ? json(free_bytes.value()) : json(nullptr);
    }

    auto active = sessions_.active_sessions();
    if (active.is_ok()) {
        stats["active_sessions"] = active.value();
    }
    return json_response(HttpStatus::OK, stats);
}

} // namespace vault::intake
