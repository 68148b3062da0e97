#include "vault/pipeline/enrichment.hpp"

#include "vault/events/events.hpp"
#include "vault/model/json.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace vault::pipeline {
namespace fs = std::filesystem;

std::string to_string(EnricherKind kind) {
    switch (kind) {
        case EnricherKind::Faces: return "faces";
        case EnricherKind::Caption: return "caption";
        case EnricherKind::Embedding: return "embedding";
        case EnricherKind::Transcript: return "transcript";
    }
    return "unknown";
}

std::optional<EnricherKind> enricher_kind_from_string(const std::string& text) {
    if (text == "faces") return EnricherKind::Faces;
    if (text == "caption") return EnricherKind::Caption;
    if (text == "embedding" || text == "clip") return EnricherKind::Embedding;
    if (text == "transcript" || text == "whisper") return EnricherKind::Transcript;
    return std::nullopt;
}

bool applies_to(EnricherKind kind, model::MediaKind media) {
    switch (kind) {
        case EnricherKind::Faces:
        case EnricherKind::Caption:
        case EnricherKind::Embedding:
            return media == model::MediaKind::Image;
        case EnricherKind::Transcript:
            return media == model::MediaKind::Video || media == model::MediaKind::Audio;
    }
    return false;
}

// ────────────────────────────────────────────────────────
// ScopedLoad
// ────────────────────────────────────────────────────────

ScopedLoad::ScopedLoad(LoadableEnricher& enricher)
    : enricher_(enricher) {
    try {
        status_ = enricher_.load();
    } catch (const std::exception& e) {
        status_ = Err<void>(Error(ErrorCode::Internal, std::string("load threw: ") + e.what()));
    }
}

ScopedLoad::~ScopedLoad() {
    try {
        enricher_.unload();
    } catch (const std::exception& e) {
        spdlog::error("Unloading {} enricher failed: {}", to_string(enricher_.kind()), e.what());
    }
}

// ────────────────────────────────────────────────────────
// EnrichmentOrchestrator
// ────────────────────────────────────────────────────────

EnrichmentOrchestrator::EnrichmentOrchestrator(config::EnrichmentConfig config, events::EventBus* bus)
    : config_(std::move(config))
    , bus_(bus) {
}

void EnrichmentOrchestrator::register_enricher(std::unique_ptr<LoadableEnricher> enricher) {
    spdlog::info("Registered {} enricher", to_string(enricher->kind()));
    enrichers_.push_back(std::move(enricher));
}

model::EnrichmentResult EnrichmentOrchestrator::enrich(const fs::path& path,
                                                       model::MediaKind media,
                                                       std::optional<double> declared_duration_seconds,
                                                       const std::string& asset_id) {
    model::EnrichmentResult result;

    // Deferral depends on the media alone, not on which enrichers are loaded
    if (applies_to(EnricherKind::Transcript, media) && enabled(EnricherKind::Transcript) &&
        declared_duration_seconds && *declared_duration_seconds > config_.max_transcribe_seconds) {
        spdlog::info("Deferring transcription of {}: {:.0f}s exceeds {:.0f}s",
                     asset_id, *declared_duration_seconds, config_.max_transcribe_seconds);
        result.transcription_deferred = true;
    }

    for (auto& enricher : enrichers_) {
        const EnricherKind kind = enricher->kind();
        if (!applies_to(kind, media) || !enabled(kind)) {
            continue;
        }
        if (kind == EnricherKind::Transcript && result.transcription_deferred) {
            continue;
        }

        auto output = run_one(*enricher, path);
        if (output.is_error()) {
            record_failure(kind, output.error().message, asset_id, result);
            continue;
        }

        auto merged = merge(kind, std::move(output.value()), asset_id, result);
        if (merged.is_error()) {
            record_failure(kind, merged.error().message, asset_id, result);
        }
    }

    return result;
}

bool EnrichmentOrchestrator::enabled(EnricherKind kind) const {
    switch (kind) {
        case EnricherKind::Faces: return config_.faces_enabled;
        case EnricherKind::Caption: return config_.caption_enabled;
        case EnricherKind::Embedding: return config_.embedding_enabled;
        case EnricherKind::Transcript: return config_.transcript_enabled;
    }
    return false;
}

Result<EnricherOutput> EnrichmentOrchestrator::run_one(LoadableEnricher& enricher, const fs::path& path) {
    ScopedLoad guard(enricher);
    if (guard.status().is_error()) {
        return Err<EnricherOutput>(guard.status().error());
    }

    try {
        return enricher.run(path);
    } catch (const std::exception& e) {
        return fail<EnricherOutput>(ErrorCode::Internal, e.what());
    }
}

Result<void> EnrichmentOrchestrator::merge(EnricherKind kind, EnricherOutput&& output,
                                           const std::string& asset_id,
                                           model::EnrichmentResult& result) const {
    switch (kind) {
        case EnricherKind::Faces:
            result.faces = std::move(output.faces);
            return Ok();

        case EnricherKind::Caption:
            result.caption = std::move(output.caption);
            return Ok();

        case EnricherKind::Embedding: {
            if (output.embedding.empty()) {
                return Err<void>(Error(ErrorCode::InvalidArgument, "empty embedding"));
            }
            model::json body{{"asset_id", asset_id}, {"dimensions", output.embedding.size()},
                             {"embedding", output.embedding}};
            auto ref = write_artifact(asset_id + "_embedding.json", body.dump());
            if (ref.is_error()) {
                return Err<void>(ref.error());
            }
            result.embedding_ref = ref.value();
            return Ok();
        }

        case EnricherKind::Transcript: {
            model::json segments = model::json::array();
            std::string text = output.transcript_text.value_or("");
            for (const auto& segment : output.segments) {
                segments.push_back(model::to_json(segment));
                if (!output.transcript_text) {
                    if (!text.empty()) {
                        text += ' ';
                    }
                    text += segment.text;
                }
            }
            model::json body{{"asset_id", asset_id}, {"text", text}, {"segments", segments}};
            auto ref = write_artifact(asset_id + "_transcript.json", body.dump(2));
            if (ref.is_error()) {
                return Err<void>(ref.error());
            }
            result.transcript_ref = ref.value();
            return Ok();
        }
    }
    return Ok();
}

Result<std::string> EnrichmentOrchestrator::write_artifact(const std::string& file_name,
                                                           const std::string& body) const {
    std::error_code ec;
    fs::create_directories(config_.artifacts_dir, ec);
    if (ec && !fs::exists(config_.artifacts_dir)) {
        return fail<std::string>(ErrorCode::Io, "cannot create artifacts dir " + config_.artifacts_dir);
    }

    const fs::path path = fs::path(config_.artifacts_dir) / file_name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail<std::string>(ErrorCode::Io, "cannot write artifact " + path.string());
    }
    out << body;
    if (!out) {
        return fail<std::string>(ErrorCode::Io, "short write to artifact " + path.string());
    }
    return Ok(file_name);
}

void EnrichmentOrchestrator::record_failure(EnricherKind kind, const std::string& message,
                                            const std::string& asset_id,
                                            model::EnrichmentResult& result) const {
    result.errors.push_back(to_string(kind) + ": " + message);
    if (bus_ != nullptr) {
        bus_->emit(events::EnricherFailedEvent{asset_id, to_string(kind), message});
    }
}

} // namespace vault::pipeline
