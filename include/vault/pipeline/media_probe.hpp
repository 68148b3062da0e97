#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace vault::pipeline {

/**
 * @brief Measures the playing time of video and audio files
 *
 * Video is read through OpenCV's VideoCapture (frame count over frame
 * rate). Audio, and video the capture backend cannot open, go through
 * `ffprobe -show_entries format=duration`. Anything else, or a file
 * neither can measure, reports nullopt.
 */
class MediaProbe {
public:
    explicit MediaProbe(std::string ffprobe_command = "ffprobe",
                        std::chrono::seconds limit = std::chrono::seconds(60));
    virtual ~MediaProbe() = default;

    virtual std::optional<double> duration_seconds(const std::filesystem::path& path,
                                                   const std::string& mime_type) const;

    /// Duration from ffprobe's JSON output; nullopt when absent or not positive.
    static std::optional<double> parse_ffprobe_output(const std::string& stdout_text);

private:
    std::optional<double> capture_duration(const std::filesystem::path& path) const;
    std::optional<double> ffprobe_duration(const std::filesystem::path& path) const;

    std::string ffprobe_command_;
    std::chrono::seconds limit_;
};

} // namespace vault::pipeline
