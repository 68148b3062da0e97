#pragma once

#include "vault/config/config.hpp"
#include "vault/core/result.hpp"
#include "vault/events/event_bus.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace vault::pipeline {

/// Source of the processing backlog size (implemented by AssetRepository).
class BacklogSource {
public:
    virtual ~BacklogSource() = default;
    virtual Result<std::size_t> processing_backlog() const = 0;
};

/// Free bytes on the filesystem holding a path.
using DiskProbe = std::function<Result<std::uint64_t>(const std::filesystem::path&)>;

Result<std::uint64_t> filesystem_free_bytes(const std::filesystem::path& path);

struct IntakeDecision {
    bool allowed = true;
    std::string reason;
    std::uint64_t free_bytes = 0;
    std::size_t backlog = 0;
};

/**
 * @brief Gate on pulling new files into the pipeline
 *
 * Intake pauses when free space under the cache directory drops below
 * min_free_disk_bytes or the processing backlog exceeds max_backlog. A
 * failed probe also pauses. Pauses are logged and emitted as
 * IntakePausedEvent; callers treat them as a soft skip.
 */
class BackpressureGovernor {
public:
    BackpressureGovernor(config::BackpressureConfig config,
                         std::filesystem::path cache_dir,
                         const BacklogSource& backlog,
                         events::EventBus* bus = nullptr,
                         DiskProbe probe = filesystem_free_bytes);

    bool allow_intake();

    IntakeDecision evaluate() const;

private:
    config::BackpressureConfig config_;
    std::filesystem::path cache_dir_;
    const BacklogSource& backlog_;
    events::EventBus* bus_;
    DiskProbe probe_;
};

} // namespace vault::pipeline
