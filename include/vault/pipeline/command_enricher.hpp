#pragma once

#include "vault/pipeline/enrichment.hpp"
#include "vault/pipeline/subprocess.hpp"

#include <chrono>
#include <string>

namespace vault::pipeline {

/**
 * @brief Runs an external program as an enricher
 *
 * The program is invoked as `<command> <path>` and must print one JSON
 * object on stdout. Recognized keys:
 *   faces:      [{"bbox": [x1, y1, x2, y2], "confidence": 0.98}, ...]
 *   caption:    "two people on a beach"
 *   embedding:  [0.12, -0.03, ...]
 *   segments:   [{"start": 0.0, "end": 2.5, "text": "..."}, ...]
 *   text:       full transcript
 * A non-zero exit status, unparsable output or running past @p limit is
 * a failure.
 */
class CommandEnricher : public LoadableEnricher {
public:
    CommandEnricher(EnricherKind kind, std::string command,
                    std::chrono::seconds limit = std::chrono::seconds(900));

    EnricherKind kind() const override { return kind_; }

    /// Verifies the program exists and is executable.
    Result<void> load() override;
    Result<EnricherOutput> run(const std::filesystem::path& path) override;
    void unload() override;

    /// Parse program output into an EnricherOutput.
    static Result<EnricherOutput> parse_output(const std::string& stdout_text);

private:
    EnricherKind kind_;
    std::string command_;
    std::chrono::seconds limit_;
    bool loaded_ = false;
};

} // namespace vault::pipeline
