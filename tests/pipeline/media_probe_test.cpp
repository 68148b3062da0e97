#include "vault/pipeline/media_probe.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace vault::pipeline;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("vault_media_duration_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

/// Executable standing in for ffprobe; prints @p json and ignores its arguments.
fs::path write_fake_ffprobe(const fs::path& dir, const std::string& json) {
    const auto script = dir / "ffprobe";
    {
        std::ofstream out(script);
        out << "#!/bin/sh\n"
            << "cat <<'JSON'\n" << json << "\nJSON\n";
    }
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
    return script;
}

fs::path write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

} // namespace

TEST(MediaDurationTest, ParsesStringDuration) {
    auto seconds = MediaProbe::parse_ffprobe_output(R"({"format":{"duration":"10800.500000"}})");
    ASSERT_TRUE(seconds.has_value());
    EXPECT_DOUBLE_EQ(*seconds, 10800.5);
}

TEST(MediaDurationTest, ParsesNumericDuration) {
    auto seconds = MediaProbe::parse_ffprobe_output(R"({"format":{"duration":42}})");
    ASSERT_TRUE(seconds.has_value());
    EXPECT_DOUBLE_EQ(*seconds, 42.0);
}

TEST(MediaDurationTest, UnknownDurationIsNullopt) {
    EXPECT_FALSE(MediaProbe::parse_ffprobe_output(R"({"format":{"duration":"N/A"}})").has_value());
    EXPECT_FALSE(MediaProbe::parse_ffprobe_output(R"({"format":{}})").has_value());
    EXPECT_FALSE(MediaProbe::parse_ffprobe_output(R"({"format":{"duration":"0"}})").has_value());
    EXPECT_FALSE(MediaProbe::parse_ffprobe_output("not json").has_value());
    EXPECT_FALSE(MediaProbe::parse_ffprobe_output("").has_value());
}

TEST(MediaDurationTest, MeasuresAudioThroughFfprobe) {
    const auto dir = create_temp_dir();
    const auto ffprobe = write_fake_ffprobe(dir, R"({"format":{"duration":"10800.5"}})");
    const auto audio = write_file(dir / "oral history.mp3", "ID3 not really audio");

    MediaProbe probe(ffprobe.string());
    auto seconds = probe.duration_seconds(audio, "audio/mpeg");
    ASSERT_TRUE(seconds.has_value());
    EXPECT_DOUBLE_EQ(*seconds, 10800.5);

    fs::remove_all(dir);
}

TEST(MediaDurationTest, VideoFallsBackToFfprobe) {
    const auto dir = create_temp_dir();
    const auto ffprobe = write_fake_ffprobe(dir, R"({"format":{"duration":"95.25"}})");
    const auto video = write_file(dir / "clip.mp4", "no frames here");

    MediaProbe probe(ffprobe.string());
    auto seconds = probe.duration_seconds(video, "video/mp4");
    ASSERT_TRUE(seconds.has_value());
    EXPECT_DOUBLE_EQ(*seconds, 95.25);

    fs::remove_all(dir);
}

TEST(MediaDurationTest, MissingFfprobeGivesNoDuration) {
    const auto dir = create_temp_dir();
    const auto audio = write_file(dir / "song.mp3", "bytes");

    MediaProbe probe((dir / "no-such-ffprobe").string());
    EXPECT_FALSE(probe.duration_seconds(audio, "audio/mpeg").has_value());

    fs::remove_all(dir);
}

TEST(MediaDurationTest, ImagesAndDocumentsAreNotMeasured) {
    const auto dir = create_temp_dir();
    const auto ffprobe = write_fake_ffprobe(dir, R"({"format":{"duration":"12"}})");
    const auto file = write_file(dir / "scan.jpg", "bytes");

    MediaProbe probe(ffprobe.string());
    EXPECT_FALSE(probe.duration_seconds(file, "image/jpeg").has_value());
    EXPECT_FALSE(probe.duration_seconds(file, "text/plain").has_value());

    fs::remove_all(dir);
}
