/**
 * @file intake_server.cpp
 * @brief HTTP intake server: resumable uploads and batch manifests
 *
 * HOW IT WORKS:
 * 1. Configuration: defaults -> --config file -> VAULT_* env -> flags
 * 2. Upload sessions and pending batches persist in intake.db
 * 3. Assembled files land in the blob store inbox for the worker
 * 4. io_context runs on server.threads threads; SIGINT/SIGTERM stop it
 * 5. A timer reaps sessions idle longer than the upload TTL
 *
 * Run with:
 *   ./build/vault_intake_server --config vault.json --port 8080
 *
 * Test with:
 *   curl -X POST localhost:8080/upload/init \
 *        -d '{"contributorToken":"tok","filename":"a.jpg","sizeBytes":3,"mimeType":"image/jpeg"}'
 *   curl -X PUT localhost:8080/upload/chunk -H 'X-Upload-Session-ID: <id>' \
 *        -H 'Content-Range: bytes 0-2/3' --data-binary abc
 */

#include "vault/config/config.hpp"
#include "vault/events/components.hpp"
#include "vault/events/event_bus.hpp"
#include "vault/events/events.hpp"
#include "vault/intake/contributors.hpp"
#include "vault/intake/intake_api.hpp"
#include "vault/intake/manifest_batcher.hpp"
#include "vault/intake/session_manager.hpp"
#include "vault/intake/state_store.hpp"
#include "vault/network/http_router.hpp"
#include "vault/network/http_server_asio.hpp"
#include "vault/persistence/asset_repository.hpp"
#include "vault/persistence/database.hpp"
#include "vault/storage/local_blob_store.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace vault;
using namespace vault::network;

namespace {

constexpr std::chrono::minutes kReapInterval{5};

void schedule_reaper(asio::steady_timer& timer, intake::SessionManager& sessions) {
    timer.expires_after(kReapInterval);
    timer.async_wait([&timer, &sessions](const boost::system::error_code& ec) {
        if (ec) {
            return;   // Cancelled on shutdown
        }
        const std::size_t reaped = sessions.reap_expired(std::time(nullptr));
        if (reaped > 0) {
            spdlog::info("Reaped {} expired upload sessions", reaped);
        }
        schedule_reaper(timer, sessions);
    });
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    const std::vector<std::string> args(argv + 1, argv + argc);

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
    spdlog::info("Archive Vault Intake Server");
    spdlog::info("════════════════════════════════════════════");
    spdlog::info("Storage root: {}", config.storage.root);
    spdlog::info("Contributors: {}", config.contributors.size());

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
        persistence::Database intake_db(config.storage.intake_db_path);
        intake::SqliteIntakeStore state(intake_db);
        auto migrated = state.migrate();
        if (migrated.is_error()) {
            spdlog::error("Intake store unavailable: {}", to_string(migrated.error()));
            return 1;
        }

        persistence::Database vault_db(config.storage.db_path);
        persistence::AssetRepository assets(vault_db);
        migrated = assets.migrate();
        if (migrated.is_error()) {
            spdlog::error("Metadata store unavailable: {}", to_string(migrated.error()));
            return 1;
        }

        intake::ContributorRegistry contributors(config.contributors);
        intake::SessionManager sessions(config.upload, store, state, contributors, &bus);
        intake::ManifestBatcher batcher(config.batch, store, state, contributors, &bus);
        intake::IntakeApi api(sessions, batcher, &assets, config.storage.root);

        HttpRouter router;
        router.use([](const HttpContext& ctx, HttpResponse&) {
            spdlog::debug("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
            return true;
        });
        api.register_routes(router);

        spdlog::info("Registered routes:");
        for (const auto& route : router.list_routes()) {
            spdlog::info("  {}", route);
        }

        asio::io_context io_context;
        HttpServerAsio server(io_context, config.server.bind_address, config.server.port,
                              config.server.max_body_bytes);
        server.set_handler([&router](const HttpRequest& request) {
            return router.handle_request(request);
        });

        asio::steady_timer reaper(io_context);
        schedule_reaper(reaper, sessions);

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            bus.emit(events::ServerShuttingDownEvent{"signal " + std::to_string(signal_number)});
            server.stop();
            reaper.cancel();
            io_context.stop();
        });

        bus.emit(events::ServerStartedEvent{server.get_port()});

        std::vector<std::thread> workers;
        const std::size_t threads = config.server.threads > 0 ? config.server.threads : 1;
        for (std::size_t i = 1; i < threads; ++i) {
            workers.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& worker : workers) {
            worker.join();
        }

        metrics.print_stats();
    } catch (const persistence::DatabaseError& e) {
        spdlog::error("Database error: {}", e.what());
        return 1;
    } catch (const boost::system::system_error& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }

    return 0;
}
