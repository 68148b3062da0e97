/**
 * @file ingest_worker.cpp
 * @brief Ingest worker: inbox files to holding states
 *
 * HOW IT WORKS:
 * 1. Same configuration layers as the intake server
 * 2. Enrichers come from enrichment.commands, one external program per kind
 * 3. Assets a crashed run left in processing are failed, then retried
 * 4. Cycles repeat every worker.poll_interval_seconds until SIGINT/SIGTERM
 *
 * Run with:
 *   ./build/vault_ingest_worker --config vault.json
 *   ./build/vault_ingest_worker --config vault.json --once
 */

#include "vault/config/config.hpp"
#include "vault/events/components.hpp"
#include "vault/events/event_bus.hpp"
#include "vault/persistence/asset_repository.hpp"
#include "vault/persistence/database.hpp"
#include "vault/persistence/sidecar_writer.hpp"
#include "vault/pipeline/backpressure.hpp"
#include "vault/pipeline/command_enricher.hpp"
#include "vault/pipeline/dedup.hpp"
#include "vault/pipeline/enrichment.hpp"
#include "vault/pipeline/media_probe.hpp"
#include "vault/storage/local_blob_store.hpp"
#include "vault/worker/worker_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <vector>

using namespace vault;

namespace {

std::atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    const auto once_it = std::find(args.begin(), args.end(), "--once");
    const bool once = once_it != args.end();
    if (once) {
        args.erase(once_it);
    }

    auto loaded = config::load_config(config::config_path_from_args(args));
    if (loaded.is_error()) {
        spdlog::error("Configuration error: {}", to_string(loaded.error()));
        return 1;
    }
    config::AppConfig config = loaded.value();
    auto flags = config::apply_command_line(config, args);
    if (flags.is_error()) {
        spdlog::error("Command line error: {}", to_string(flags.error()));
        return 1;
    }
    config.resolve_paths();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("Archive Vault Ingest Worker");
    spdlog::info("════════════════════════════════════════════");

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    storage::LocalBlobStore store(config.storage.blob_root);
    auto initialized = store.initialize();
    if (initialized.is_error()) {
        spdlog::error("Blob store unavailable: {}", to_string(initialized.error()));
        return 1;
    }

    try {
        persistence::Database db(config.storage.db_path);
        persistence::AssetRepository assets(db);
        auto migrated = assets.migrate();
        if (migrated.is_error()) {
            spdlog::error("Metadata store unavailable: {}", to_string(migrated.error()));
            return 1;
        }

        pipeline::EnrichmentOrchestrator enrichment(config.enrichment, &bus);
        for (const auto& [name, command] : config.enrichment.commands) {
            auto kind = pipeline::enricher_kind_from_string(name);
            if (!kind) {
                spdlog::warn("Ignoring enricher command for unknown kind '{}'", name);
                continue;
            }
            enrichment.register_enricher(std::make_unique<pipeline::CommandEnricher>(
                *kind, command, std::chrono::seconds(config.enrichment.command_timeout_seconds)));
            spdlog::info("Enricher {}: {}", pipeline::to_string(*kind), command);
        }

        pipeline::DedupResolver dedup(assets, config.dedup.phash_threshold);
        pipeline::BackpressureGovernor governor(config.backpressure, config.worker.cache_dir, assets, &bus);
        persistence::SidecarWriter sidecars(config.worker.sidecar_dir, &store);
        pipeline::MediaProbe probe(config.enrichment.ffprobe_command);

        worker::WorkerLoop loop(config.worker,
                                worker::WorkerDeps{store, assets, dedup, enrichment, governor, sidecars, probe},
                                &bus);

        auto recovered = loop.recover_interrupted();
        if (recovered.is_error()) {
            spdlog::error("Crash recovery failed: {}", to_string(recovered.error()));
            return 1;
        }

        if (once) {
            const worker::CycleReport report = loop.run_cycle();
            metrics.print_stats();
            return report.failed > 0 ? 2 : 0;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        loop.run_forever(g_stop);

        metrics.print_stats();
    } catch (const persistence::DatabaseError& e) {
        spdlog::error("Database error: {}", e.what());
        return 1;
    }

    return 0;
}
