#include "vault/config/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace vault {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

template<typename T>
void read_field(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const json& section_of(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

void read_document(const json& root, AppConfig& config) {
    const json& server = section_of(root, "server");
    read_field(server, "bind_address", config.server.bind_address);
    read_field(server, "port", config.server.port);
    read_field(server, "threads", config.server.threads);
    read_field(server, "max_body_bytes", config.server.max_body_bytes);

    const json& upload = section_of(root, "upload");
    read_field(upload, "chunk_size_hint", config.upload.chunk_size_hint);
    read_field(upload, "max_file_bytes", config.upload.max_file_bytes);
    read_field(upload, "session_ttl_seconds", config.upload.session_ttl_seconds);

    read_field(section_of(root, "batch"), "max_files", config.batch.max_files);
    read_field(section_of(root, "dedup"), "phash_threshold", config.dedup.phash_threshold);

    const json& enrichment = section_of(root, "enrichment");
    read_field(enrichment, "max_transcribe_seconds", config.enrichment.max_transcribe_seconds);
    read_field(enrichment, "faces_enabled", config.enrichment.faces_enabled);
    read_field(enrichment, "caption_enabled", config.enrichment.caption_enabled);
    read_field(enrichment, "embedding_enabled", config.enrichment.embedding_enabled);
    read_field(enrichment, "transcript_enabled", config.enrichment.transcript_enabled);
    read_field(enrichment, "commands", config.enrichment.commands);
    read_field(enrichment, "artifacts_dir", config.enrichment.artifacts_dir);
    read_field(enrichment, "command_timeout_seconds", config.enrichment.command_timeout_seconds);
    read_field(enrichment, "ffprobe_command", config.enrichment.ffprobe_command);

    const json& backpressure = section_of(root, "backpressure");
    read_field(backpressure, "min_free_disk_bytes", config.backpressure.min_free_disk_bytes);
    read_field(backpressure, "max_backlog", config.backpressure.max_backlog);

    const json& worker = section_of(root, "worker");
    read_field(worker, "cache_dir", config.worker.cache_dir);
    read_field(worker, "sidecar_dir", config.worker.sidecar_dir);
    read_field(worker, "poll_interval_seconds", config.worker.poll_interval_seconds);
    read_field(worker, "max_attempts", config.worker.max_attempts);

    const json& storage = section_of(root, "storage");
    read_field(storage, "root", config.storage.root);
    read_field(storage, "db_path", config.storage.db_path);
    read_field(storage, "intake_db_path", config.storage.intake_db_path);
    read_field(storage, "blob_root", config.storage.blob_root);

    read_field(root, "contributors", config.contributors);
    read_field(root, "log_level", config.log_level);
}

template<typename T>
Result<void> parse_number(const std::string& name, const std::string& text, T& target) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < 0) {
            return Err<void>(Error(ErrorCode::InvalidArgument, name + " must be a non-negative integer"));
        }
        target = static_cast<T>(value);
    } catch (const std::exception&) {
        return Err<void>(Error(ErrorCode::InvalidArgument, name + " must be a non-negative integer"));
    }
    return Ok();
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && value[0] != '\0') ? value : nullptr;
}

} // namespace

void AppConfig::resolve_paths() {
    const fs::path root(storage.root);
    if (storage.db_path.empty()) {
        storage.db_path = (root / "vault.db").string();
    }
    if (storage.intake_db_path.empty()) {
        storage.intake_db_path = (root / "intake.db").string();
    }
    if (storage.blob_root.empty()) {
        storage.blob_root = (root / "blobs").string();
    }
    if (worker.cache_dir.empty()) {
        worker.cache_dir = (root / "cache").string();
    }
    if (worker.sidecar_dir.empty()) {
        worker.sidecar_dir = (root / "metadata" / "sidecars").string();
    }
    if (enrichment.artifacts_dir.empty()) {
        enrichment.artifacts_dir = (root / "metadata" / "artifacts").string();
    }
}

Result<AppConfig> load_config(const std::string& path) {
    AppConfig config;

    if (!path.empty()) {
        std::ifstream in(path);
        if (!in) {
            return fail<AppConfig>(ErrorCode::NotFound, "config file not found: " + path);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        json root = json::parse(buffer.str(), nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            return fail<AppConfig>(ErrorCode::InvalidArgument, "config file is not a JSON object: " + path);
        }
        try {
            read_document(root, config);
        } catch (const json::exception& e) {
            return fail<AppConfig>(ErrorCode::InvalidArgument, std::string("bad config value: ") + e.what());
        }
    }

    auto env_result = apply_environment(config);
    if (env_result.is_error()) {
        return Err<AppConfig>(env_result.error());
    }
    return Ok(config);
}

Result<void> apply_environment(AppConfig& config) {
    if (const char* v = env("VAULT_PORT")) {
        auto r = parse_number("VAULT_PORT", v, config.server.port);
        if (r.is_error()) return r;
    }
    if (const char* v = env("VAULT_THREADS")) {
        auto r = parse_number("VAULT_THREADS", v, config.server.threads);
        if (r.is_error()) return r;
    }
    if (const char* v = env("VAULT_CHUNK_SIZE")) {
        auto r = parse_number("VAULT_CHUNK_SIZE", v, config.upload.chunk_size_hint);
        if (r.is_error()) return r;
    }
    if (const char* v = env("VAULT_MAX_FILE_BYTES")) {
        auto r = parse_number("VAULT_MAX_FILE_BYTES", v, config.upload.max_file_bytes);
        if (r.is_error()) return r;
    }
    if (const char* v = env("VAULT_PHASH_THRESHOLD")) {
        auto r = parse_number("VAULT_PHASH_THRESHOLD", v, config.dedup.phash_threshold);
        if (r.is_error()) return r;
    }
    if (const char* v = env("VAULT_MIN_FREE_DISK_BYTES")) {
        auto r = parse_number("VAULT_MIN_FREE_DISK_BYTES", v, config.backpressure.min_free_disk_bytes);
        if (r.is_error()) return r;
    }
    if (const char* v = env("VAULT_MAX_BACKLOG")) {
        auto r = parse_number("VAULT_MAX_BACKLOG", v, config.backpressure.max_backlog);
        if (r.is_error()) return r;
    }
    if (const char* v = env("VAULT_POLL_INTERVAL")) {
        auto r = parse_number("VAULT_POLL_INTERVAL", v, config.worker.poll_interval_seconds);
        if (r.is_error()) return r;
    }
    if (const char* v = env("VAULT_ROOT")) {
        config.storage.root = v;
    }
    if (const char* v = env("VAULT_DB_PATH")) {
        config.storage.db_path = v;
    }
    if (const char* v = env("VAULT_LOG_LEVEL")) {
        config.log_level = v;
    }
    if (const char* v = env("VAULT_CONTRIBUTORS")) {
        std::stringstream list(v);
        std::string entry;
        while (std::getline(list, entry, ',')) {
            const auto eq = entry.find('=');
            if (eq == std::string::npos || eq == 0) {
                return Err<void>(Error(ErrorCode::InvalidArgument,
                                       "VAULT_CONTRIBUTORS entries must be token=Name"));
            }
            config.contributors[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    return Ok();
}

Result<void> apply_command_line(AppConfig& config, const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if (arg == "--config" && has_value) {
            ++i;
        } else if (arg == "--port" && has_value) {
            auto r = parse_number("--port", args[++i], config.server.port);
            if (r.is_error()) return r;
        } else if (arg == "--threads" && has_value) {
            auto r = parse_number("--threads", args[++i], config.server.threads);
            if (r.is_error()) return r;
        } else if (arg == "--root" && has_value) {
            config.storage.root = args[++i];
        } else if (arg == "--log-level" && has_value) {
            config.log_level = args[++i];
        } else {
            return Err<void>(Error(ErrorCode::InvalidArgument, "unknown or incomplete argument: " + arg));
        }
    }
    return Ok();
}

std::string config_path_from_args(const std::vector<std::string>& args) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--config") {
            return args[i + 1];
        }
    }
    if (const char* v = env("VAULT_CONFIG")) {
        return v;
    }
    return {};
}

} // namespace config
} // namespace vault
