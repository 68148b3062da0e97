#include "vault/pipeline/media_probe.hpp"

#include "vault/model/types.hpp"
#include "vault/pipeline/subprocess.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/videoio.hpp>
#include <spdlog/spdlog.h>

namespace vault::pipeline {

MediaProbe::MediaProbe(std::string ffprobe_command, std::chrono::seconds limit)
    : ffprobe_command_(std::move(ffprobe_command))
    , limit_(limit) {
}

std::optional<double> MediaProbe::duration_seconds(const std::filesystem::path& path,
                                                   const std::string& mime_type) const {
    switch (model::media_kind_from_mime(mime_type)) {
        case model::MediaKind::Video:
            if (auto seconds = capture_duration(path)) {
                return seconds;
            }
            return ffprobe_duration(path);
        case model::MediaKind::Audio:
            return ffprobe_duration(path);
        default:
            return std::nullopt;
    }
}

std::optional<double> MediaProbe::parse_ffprobe_output(const std::string& stdout_text) {
    const auto j = nlohmann::json::parse(stdout_text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    const auto format = j.find("format");
    if (format == j.end() || !format->is_object()) {
        return std::nullopt;
    }
    const auto duration = format->find("duration");
    if (duration == format->end()) {
        return std::nullopt;
    }

    double seconds = 0.0;
    if (duration->is_number()) {
        seconds = duration->get<double>();
    } else if (duration->is_string()) {
        // ffprobe prints numbers as strings, "N/A" when unknown
        try {
            seconds = std::stod(duration->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!(seconds > 0.0)) {
        return std::nullopt;
    }
    return seconds;
}

std::optional<double> MediaProbe::capture_duration(const std::filesystem::path& path) const {
    try {
        cv::VideoCapture capture(path.string());
        if (!capture.isOpened()) {
            spdlog::debug("VideoCapture could not open {}", path.string());
            return std::nullopt;
        }

        const double frames = capture.get(cv::CAP_PROP_FRAME_COUNT);
        const double fps = capture.get(cv::CAP_PROP_FPS);
        capture.release();

        if (frames <= 0.0 || fps <= 0.0) {
            return std::nullopt;
        }
        return frames / fps;
    } catch (const cv::Exception& e) {
        spdlog::warn("Duration probe failed for {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::optional<double> MediaProbe::ffprobe_duration(const std::filesystem::path& path) const {
    if (ffprobe_command_.empty()) {
        return std::nullopt;
    }
    auto output = run_command(ffprobe_command_ + " -v error -show_entries format=duration -of json " +
                              shell_quote(path.string()), limit_);
    if (output.is_error()) {
        spdlog::warn("ffprobe failed for {}: {}", path.string(), output.error().message);
        return std::nullopt;
    }
    auto seconds = parse_ffprobe_output(output.value());
    if (!seconds) {
        spdlog::debug("ffprobe reported no duration for {}", path.string());
    }
    return seconds;
}

} // namespace vault::pipeline
