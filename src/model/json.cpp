#include "vault/model/json.hpp"

#include "vault/core/ids.hpp"

#include <initializer_list>

namespace vault {
namespace model {
namespace {

const json* find_any(const json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) {
        return nullptr;
    }
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            return &(*it);
        }
    }
    return nullptr;
}

std::optional<std::string> optional_text(const json& j, std::initializer_list<const char*> keys) {
    const json* value = find_any(j, keys);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        auto text = value->get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    if (value->is_number()) {
        return value->dump();
    }
    return std::nullopt;
}

json optional_to_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

json to_json(const BatchContext& context) {
    json j;
    j["decade"] = optional_to_json(context.decade);
    j["event"] = optional_to_json(context.event);
    j["notes"] = optional_to_json(context.notes);
    return j;
}

BatchContext context_from_json(const json& j) {
    BatchContext context;
    if (const json* decade = find_any(j, {"decade"})) {
        if (decade->is_number_integer()) {
            context.decade = std::to_string(decade->get<long long>()) + "s";
        } else if (decade->is_string() && !decade->get<std::string>().empty()) {
            context.decade = decade->get<std::string>();
        }
    }
    context.event = optional_text(j, {"event", "eventName", "event_name"});
    context.notes = optional_text(j, {"notes"});
    return context;
}

json to_json(const ManifestFile& file) {
    return json{
        {"origin_file_id", file.origin_file_id},
        {"original_name", file.original_name},
        {"size_bytes", file.size_bytes},
    };
}

Result<ManifestFile> manifest_file_from_json(const json& j) {
    if (!j.is_object()) {
        return fail<ManifestFile>(ErrorCode::InvalidArgument, "file entry must be an object");
    }

    ManifestFile file;
    const auto id = optional_text(j, {"origin_file_id", "originFileID", "originFileId", "drive_file_id"});
    if (!id) {
        return fail<ManifestFile>(ErrorCode::InvalidArgument, "file entry missing origin file id");
    }
    file.origin_file_id = *id;
    file.original_name = optional_text(j, {"original_name", "originalName", "name", "filename"}).value_or("");

    if (const json* size = find_any(j, {"size_bytes", "sizeBytes", "size"})) {
        if (!size->is_number_unsigned() && !size->is_number_integer()) {
            return fail<ManifestFile>(ErrorCode::InvalidArgument, "file size must be an integer");
        }
        const auto raw = size->get<long long>();
        if (raw < 0) {
            return fail<ManifestFile>(ErrorCode::InvalidArgument, "file size must not be negative");
        }
        file.size_bytes = static_cast<std::uint64_t>(raw);
    }
    return Ok(file);
}

Result<std::vector<ManifestFile>> manifest_files_from_json(const json& j) {
    std::vector<ManifestFile> files;
    if (j.is_null()) {
        return Ok(files);
    }
    if (!j.is_array()) {
        return fail<std::vector<ManifestFile>>(ErrorCode::InvalidArgument, "files must be an array");
    }
    files.reserve(j.size());
    for (const auto& entry : j) {
        auto file = manifest_file_from_json(entry);
        if (file.is_error()) {
            return Err<std::vector<ManifestFile>>(file.error());
        }
        files.push_back(std::move(file.value()));
    }
    return Ok(files);
}

json to_json(const Manifest& manifest) {
    json files = json::array();
    for (const auto& file : manifest.files) {
        files.push_back(to_json(file));
    }

    json j;
    j["batch_id"] = manifest.batch_id;
    j["contributor_token"] = manifest.contributor_token;
    j["contributor_display_name"] = manifest.contributor_name;
    j["created_at"] = format_iso8601(manifest.created_at);
    j["finished_at"] = format_iso8601(manifest.finished_at);
    j["context"] = to_json(manifest.context);
    j["files"] = files;
    j["total_files"] = manifest.files.size();
    j["total_bytes"] = manifest.total_bytes();
    return j;
}

Result<Manifest> manifest_from_json(const json& j) {
    if (!j.is_object()) {
        return fail<Manifest>(ErrorCode::InvalidArgument, "manifest must be an object");
    }

    Manifest manifest;
    const auto batch_id = optional_text(j, {"batch_id"});
    if (!batch_id) {
        return fail<Manifest>(ErrorCode::InvalidArgument, "manifest missing batch_id");
    }
    manifest.batch_id = *batch_id;
    manifest.contributor_token = optional_text(j, {"contributor_token"}).value_or("");
    manifest.contributor_name = optional_text(j, {"contributor_display_name"}).value_or("");
    manifest.created_at = parse_iso8601(optional_text(j, {"created_at"}).value_or(""));
    manifest.finished_at = parse_iso8601(optional_text(j, {"finished_at"}).value_or(""));

    // Older manifests carry decade/event/notes at the top level
    if (const json* context = find_any(j, {"context"})) {
        manifest.context = context_from_json(*context);
    } else {
        manifest.context = context_from_json(j);
    }

    auto files = manifest_files_from_json(j.contains("files") ? j.at("files") : json(nullptr));
    if (files.is_error()) {
        return Err<Manifest>(files.error());
    }
    manifest.files = std::move(files.value());
    return Ok(manifest);
}

json to_json(const DetectedFace& face) {
    return json{{"bbox", face.bbox}, {"confidence", face.confidence}};
}

json to_json(const TranscriptSegment& segment) {
    return json{{"start", segment.start}, {"end", segment.end}, {"text", segment.text}};
}

json sidecar_json(const Asset& asset, const EnrichmentResult& enrichment) {
    json faces = json::array();
    for (const auto& face : enrichment.faces) {
        faces.push_back(to_json(face));
    }

    json j;
    j["schema_version"] = kSidecarSchemaVersion;
    j["asset_id"] = asset.asset_id;
    j["origin_file_id"] = asset.origin_file_id;
    j["contributor_token"] = asset.contributor_token;
    j["batch_id"] = asset.batch_id;
    j["original_filename"] = asset.original_filename;
    j["mime_type"] = asset.mime_type;
    j["size_bytes"] = asset.size_bytes;
    j["sha256"] = asset.sha256;
    j["phash"] = optional_to_json(asset.phash);
    j["status"] = to_string(asset.status);
    j["duplicate_of"] = optional_to_json(asset.duplicate_of);
    j["duplicate_method"] = asset.duplicate_method ? json(to_string(*asset.duplicate_method)) : json(nullptr);
    j["decade_estimate"] = optional_to_json(asset.decade_estimate);
    j["decade_confidence"] = asset.decade_confidence ? json(*asset.decade_confidence) : json(nullptr);
    j["exif_date"] = optional_to_json(asset.exif_date);
    j["gps"] = json{
        {"lat", asset.gps_lat ? json(*asset.gps_lat) : json(nullptr)},
        {"lon", asset.gps_lon ? json(*asset.gps_lon) : json(nullptr)},
    };
    j["event"] = optional_to_json(asset.event);
    j["notes"] = optional_to_json(asset.notes);
    j["caption"] = optional_to_json(enrichment.caption);
    j["faces"] = faces;
    j["faces_count"] = enrichment.faces.size();
    j["embedding_ref"] = optional_to_json(enrichment.embedding_ref);
    j["transcript_ref"] = optional_to_json(enrichment.transcript_ref);
    j["transcription_deferred"] = enrichment.transcription_deferred;
    j["duration_seconds"] = asset.duration_seconds ? json(*asset.duration_seconds) : json(nullptr);
    j["errors"] = enrichment.errors;
    j["attempts"] = asset.attempts;
    j["last_error"] = asset.last_error;
    j["processing"] = json{
        {"created_at", format_iso8601(asset.created_at)},
        {"processed_at", format_iso8601(asset.processed_at)},
    };
    return j;
}

} // namespace model
} // namespace vault
