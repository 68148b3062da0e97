#include "vault/pipeline/command_enricher.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace vault::pipeline {
namespace fs = std::filesystem;
using json = nlohmann::json;

CommandEnricher::CommandEnricher(EnricherKind kind, std::string command, std::chrono::seconds limit)
    : kind_(kind)
    , command_(std::move(command))
    , limit_(limit) {
}

Result<void> CommandEnricher::load() {
    const std::string program = program_of(command_);
    if (program.empty()) {
        return Err<void>(Error(ErrorCode::InvalidArgument, "no command configured"));
    }
    if (!resolvable(program)) {
        return Err<void>(Error(ErrorCode::NotFound, "program not found: " + program));
    }
    loaded_ = true;
    return Ok();
}

Result<EnricherOutput> CommandEnricher::run(const fs::path& path) {
    if (!loaded_) {
        return fail<EnricherOutput>(ErrorCode::Internal, "run() before load()");
    }

    spdlog::debug("Running {} enricher on {}", to_string(kind_), path.string());
    auto output = run_command(command_ + " " + shell_quote(path.string()), limit_);
    if (output.is_error()) {
        return Err<EnricherOutput>(output.error());
    }
    return parse_output(output.value());
}

void CommandEnricher::unload() {
    loaded_ = false;
}

Result<EnricherOutput> CommandEnricher::parse_output(const std::string& stdout_text) {
    json j = json::parse(stdout_text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return fail<EnricherOutput>(ErrorCode::InvalidArgument, "enricher output is not a JSON object");
    }

    EnricherOutput output;
    try {
        if (auto it = j.find("faces"); it != j.end() && it->is_array()) {
            for (const auto& face : *it) {
                model::DetectedFace detected;
                detected.bbox = face.value("bbox", std::vector<double>{});
                detected.confidence = face.value("confidence", 0.0);
                output.faces.push_back(std::move(detected));
            }
        }
        if (auto it = j.find("caption"); it != j.end() && it->is_string()) {
            output.caption = it->get<std::string>();
        }
        if (auto it = j.find("embedding"); it != j.end() && it->is_array()) {
            output.embedding = it->get<std::vector<double>>();
        }
        if (auto it = j.find("segments"); it != j.end() && it->is_array()) {
            for (const auto& segment : *it) {
                model::TranscriptSegment parsed;
                parsed.start = segment.value("start", 0.0);
                parsed.end = segment.value("end", 0.0);
                parsed.text = segment.value("text", "");
                output.segments.push_back(std::move(parsed));
            }
        }
        if (auto it = j.find("text"); it != j.end() && it->is_string()) {
            output.transcript_text = it->get<std::string>();
        }
    } catch (const json::exception& e) {
        return fail<EnricherOutput>(ErrorCode::InvalidArgument, std::string("bad enricher output: ") + e.what());
    }
    return Ok(output);
}

} // namespace vault::pipeline
