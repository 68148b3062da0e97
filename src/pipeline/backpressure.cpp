#include "vault/pipeline/backpressure.hpp"

#include "vault/events/events.hpp"

#include <spdlog/spdlog.h>

namespace vault::pipeline {
namespace fs = std::filesystem;

Result<std::uint64_t> filesystem_free_bytes(const fs::path& path) {
    std::error_code ec;
    fs::path probe_path = path;
    // Walk up to an existing ancestor; the cache dir may not exist yet
    while (!probe_path.empty() && !fs::exists(probe_path, ec)) {
        probe_path = probe_path.parent_path();
    }
    if (probe_path.empty()) {
        probe_path = fs::current_path(ec);
    }

    const fs::space_info info = fs::space(probe_path, ec);
    if (ec) {
        return fail<std::uint64_t>(ErrorCode::Io, "disk space query failed for " + probe_path.string() + ": " + ec.message());
    }
    return Ok(static_cast<std::uint64_t>(info.available));
}

BackpressureGovernor::BackpressureGovernor(config::BackpressureConfig config,
                                           fs::path cache_dir,
                                           const BacklogSource& backlog,
                                           events::EventBus* bus,
                                           DiskProbe probe)
    : config_(config)
    , cache_dir_(std::move(cache_dir))
    , backlog_(backlog)
    , bus_(bus)
    , probe_(std::move(probe)) {
}

bool BackpressureGovernor::allow_intake() {
    const IntakeDecision decision = evaluate();
    if (decision.allowed) {
        spdlog::debug("Intake allowed: free={} backlog={}", decision.free_bytes, decision.backlog);
        return true;
    }

    spdlog::warn("Intake paused: {}", decision.reason);
    if (bus_ != nullptr) {
        bus_->emit(events::IntakePausedEvent{decision.reason, decision.free_bytes, decision.backlog});
    }
    return false;
}

IntakeDecision BackpressureGovernor::evaluate() const {
    IntakeDecision decision;

    auto free_bytes = probe_(cache_dir_);
    if (free_bytes.is_error()) {
        decision.allowed = false;
        decision.reason = "disk probe failed: " + free_bytes.error().message;
        return decision;
    }
    decision.free_bytes = free_bytes.value();

    auto backlog = backlog_.processing_backlog();
    if (backlog.is_error()) {
        decision.allowed = false;
        decision.reason = "backlog query failed: " + backlog.error().message;
        return decision;
    }
    decision.backlog = backlog.value();

    if (decision.free_bytes < config_.min_free_disk_bytes) {
        decision.allowed = false;
        decision.reason = "free disk " + std::to_string(decision.free_bytes) + " below minimum " +
                          std::to_string(config_.min_free_disk_bytes);
        return decision;
    }

    if (decision.backlog > config_.max_backlog) {
        decision.allowed = false;
        decision.reason = "backlog " + std::to_string(decision.backlog) + " above maximum " +
                          std::to_string(config_.max_backlog);
        return decision;
    }

    return decision;
}

} // namespace vault::pipeline
