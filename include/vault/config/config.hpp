#pragma once

/**
 * @file config.hpp
 * @brief Runtime configuration for the intake server and ingest worker
 *
 * Every key has a default, so an empty or missing config file yields a
 * runnable setup. Precedence, lowest to highest:
 *   defaults -> JSON file -> VAULT_* environment -> command line
 *
 * EXAMPLE FILE:
 * {
 *   "server":   { "port": 8080, "threads": 4 },
 *   "storage":  { "root": "/srv/vault" },
 *   "contributors": { "tok-aunt-mary": "Aunt Mary" },
 *   "dedup":    { "phash_threshold": 6 }
 * }
 */

#include "vault/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vault {
namespace config {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8080;
    std::size_t threads = 4;
    std::size_t max_body_bytes = 64ull * 1024 * 1024;
};

struct UploadConfig {
    std::uint64_t chunk_size_hint = 10ull * 1024 * 1024;
    std::uint64_t max_file_bytes = 5000ull * 1024 * 1024;
    long session_ttl_seconds = 24 * 3600;
};

struct BatchConfig {
    std::size_t max_files = 500;
};

struct DedupConfig {
    int phash_threshold = 6;
};

struct EnrichmentConfig {
    double max_transcribe_seconds = 8 * 60;
    bool faces_enabled = true;
    bool caption_enabled = true;
    bool embedding_enabled = true;
    bool transcript_enabled = true;
    /// External enricher programs keyed by kind ("faces", "caption", ...).
    /// A kind without a command is not registered.
    std::map<std::string, std::string> commands;
    std::string artifacts_dir;
    long command_timeout_seconds = 15 * 60;   // 0 disables the limit
    std::string ffprobe_command = "ffprobe";
};

struct BackpressureConfig {
    std::uint64_t min_free_disk_bytes = 30ull * 1024 * 1024 * 1024;
    std::size_t max_backlog = 5000;
};

struct WorkerConfig {
    std::string cache_dir;
    std::string sidecar_dir;
    long poll_interval_seconds = 60;
    int max_attempts = 3;
};

struct StorageConfig {
    std::string root = "./vault-data";
    std::string db_path;
    std::string intake_db_path;
    std::string blob_root;           // LocalBlobStore directory tree
};

struct AppConfig {
    ServerConfig server;
    UploadConfig upload;
    BatchConfig batch;
    DedupConfig dedup;
    EnrichmentConfig enrichment;
    BackpressureConfig backpressure;
    WorkerConfig worker;
    StorageConfig storage;
    std::map<std::string, std::string> contributors;   // token -> display name
    std::string log_level = "info";

    /// Fill empty paths from storage.root.
    void resolve_paths();
};

/**
 * @brief Load configuration from a JSON file
 *
 * An empty @p path skips the file and starts from defaults. Environment
 * overrides are applied afterwards. Paths are left unresolved so a
 * command line --root still takes effect; call resolve_paths() last.
 *
 * RETURNS:
 * NotFound when @p path is given but missing, InvalidArgument when the file
 * does not parse or a key has the wrong type.
 */
Result<AppConfig> load_config(const std::string& path);

/**
 * @brief Apply VAULT_* environment variables
 *
 * Recognized: VAULT_PORT, VAULT_THREADS, VAULT_ROOT, VAULT_DB_PATH,
 * VAULT_LOG_LEVEL, VAULT_CHUNK_SIZE, VAULT_MAX_FILE_BYTES,
 * VAULT_PHASH_THRESHOLD, VAULT_MIN_FREE_DISK_BYTES, VAULT_MAX_BACKLOG,
 * VAULT_POLL_INTERVAL, VAULT_CONTRIBUTORS ("token=Name,token2=Name2").
 */
Result<void> apply_environment(AppConfig& config);

/**
 * @brief Apply "--port N", "--root DIR", "--log-level L" and friends
 *
 * "--config" is consumed by the caller before load_config and skipped here.
 */
Result<void> apply_command_line(AppConfig& config, const std::vector<std::string>& args);

/// Value of "--config PATH" in @p args, empty when absent.
std::string config_path_from_args(const std::vector<std::string>& args);

} // namespace config
} // namespace vault
