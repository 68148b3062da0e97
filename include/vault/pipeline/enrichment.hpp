#pragma once

/**
 * @file enrichment.hpp
 * @brief Sequential enrichment of one asset by pluggable enrichers
 *
 * WHAT IT DOES:
 * - Runs each registered enricher that applies to the media kind
 * - Brackets every run with load()/unload() through ScopedLoad, so at
 *   most one model is resident at a time
 * - Records failures as "<kind>: <message>" and keeps going
 * - Skips transcription above the duration ceiling and marks it deferred
 * - Writes embedding and transcript payloads as JSON artifacts
 */

#include "vault/config/config.hpp"
#include "vault/core/result.hpp"
#include "vault/events/event_bus.hpp"
#include "vault/model/types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vault::pipeline {

enum class EnricherKind {
    Faces,
    Caption,
    Embedding,
    Transcript
};

std::string to_string(EnricherKind kind);
std::optional<EnricherKind> enricher_kind_from_string(const std::string& text);

/// Whether an enricher of @p kind processes @p media.
bool applies_to(EnricherKind kind, model::MediaKind media);

struct EnricherOutput {
    std::vector<model::DetectedFace> faces;
    std::optional<std::string> caption;
    std::vector<double> embedding;
    std::vector<model::TranscriptSegment> segments;
    std::optional<std::string> transcript_text;
};

/**
 * @brief An enrichment step with an explicit resource lifecycle
 *
 * unload() is called after every load() attempt, including failed ones,
 * and must tolerate being called when nothing is loaded.
 */
class LoadableEnricher {
public:
    virtual ~LoadableEnricher() = default;

    virtual EnricherKind kind() const = 0;
    virtual Result<void> load() = 0;
    virtual Result<EnricherOutput> run(const std::filesystem::path& path) = 0;
    virtual void unload() = 0;
};

/**
 * @brief Loads an enricher for the lifetime of the guard
 *
 * @code
 * ScopedLoad guard(enricher);
 * if (guard.status().is_error()) { ... }
 * auto output = enricher.run(path);
 * @endcode
 */
class ScopedLoad {
public:
    explicit ScopedLoad(LoadableEnricher& enricher);
    ~ScopedLoad();

    ScopedLoad(const ScopedLoad&) = delete;
    ScopedLoad& operator=(const ScopedLoad&) = delete;

    const Result<void>& status() const { return status_; }

private:
    LoadableEnricher& enricher_;
    Result<void> status_;
};

class EnrichmentOrchestrator {
public:
    EnrichmentOrchestrator(config::EnrichmentConfig config, events::EventBus* bus = nullptr);

    void register_enricher(std::unique_ptr<LoadableEnricher> enricher);

    std::size_t enricher_count() const { return enrichers_.size(); }

    /**
     * @brief Run all applicable enrichers against @p path
     *
     * Never fails as a whole: per-enricher failures land in
     * EnrichmentResult::errors.
     *
     * @param declared_duration_seconds Media duration, nullopt when unknown.
     *        Unknown durations are treated as within the ceiling.
     */
    model::EnrichmentResult enrich(const std::filesystem::path& path,
                                   model::MediaKind media,
                                   std::optional<double> declared_duration_seconds,
                                   const std::string& asset_id);

private:
    bool enabled(EnricherKind kind) const;

    Result<EnricherOutput> run_one(LoadableEnricher& enricher, const std::filesystem::path& path);

    Result<void> merge(EnricherKind kind, EnricherOutput&& output, const std::string& asset_id,
                       model::EnrichmentResult& result) const;

    Result<std::string> write_artifact(const std::string& file_name, const std::string& body) const;

    void record_failure(EnricherKind kind, const std::string& message, const std::string& asset_id,
                        model::EnrichmentResult& result) const;

    config::EnrichmentConfig config_;
    events::EventBus* bus_;
    std::vector<std::unique_ptr<LoadableEnricher>> enrichers_;
};

} // namespace vault::pipeline
