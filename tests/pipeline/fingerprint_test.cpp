#include "vault/pipeline/fingerprint.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace vault::pipeline;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("vault_fingerprint_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

fs::path write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

/// Deterministic blocky noise, offset by @p brightness.
fs::path write_pattern(const fs::path& path, int brightness) {
    cv::Mat image(64, 64, CV_8UC1);
    std::uint32_t state = 12345;
    std::vector<int> blocks(16 * 16);
    for (auto& block : blocks) {
        state = state * 1103515245u + 12345u;
        block = static_cast<int>((state >> 16) % 200);
    }
    for (int y = 0; y < image.rows; ++y) {
        for (int x = 0; x < image.cols; ++x) {
            image.at<uchar>(y, x) = static_cast<uchar>(blocks[(y / 4) * 16 + x / 4] + brightness);
        }
    }
    cv::imwrite(path.string(), image);
    return path;
}

} // namespace

TEST(FingerprintTest, Sha256OfKnownInputs) {
    const auto dir = create_temp_dir();
    auto abc = FingerprintEngine::sha256_file(write_file(dir / "abc.txt", "abc"));
    ASSERT_TRUE(abc.is_ok());
    EXPECT_EQ(abc.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto empty = FingerprintEngine::sha256_file(write_file(dir / "empty.txt", ""));
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(empty.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    const std::vector<std::uint8_t> bytes = {'a', 'b', 'c'};
    EXPECT_EQ(FingerprintEngine::sha256_bytes(bytes), abc.value());
}

TEST(FingerprintTest, MissingFileIsIo) {
    auto result = FingerprintEngine::sha256_file(create_temp_dir() / "nope.bin");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, vault::ErrorCode::Io);
}

TEST(FingerprintTest, PhashOnlyForImages) {
    const auto dir = create_temp_dir();
    FingerprintEngine engine;

    auto text = engine.fingerprint(write_file(dir / "doc.txt", "not an image"), "text/plain");
    ASSERT_TRUE(text.is_ok());
    EXPECT_FALSE(text.value().phash.has_value());

    // Undecodable image still gets a sha256
    auto broken = engine.fingerprint(write_file(dir / "broken.jpg", "garbage"), "image/jpeg");
    ASSERT_TRUE(broken.is_ok());
    EXPECT_EQ(broken.value().sha256.size(), 64u);
    EXPECT_FALSE(broken.value().phash.has_value());
}

TEST(FingerprintTest, PhashIsStableUnderBrightnessShift) {
    const auto dir = create_temp_dir();
    FingerprintEngine engine;

    auto original = engine.fingerprint(write_pattern(dir / "a.png", 0), "image/png");
    auto brighter = engine.fingerprint(write_pattern(dir / "b.png", 20), "image/png");
    ASSERT_TRUE(original.is_ok());
    ASSERT_TRUE(brighter.is_ok());
    ASSERT_TRUE(original.value().phash.has_value());
    ASSERT_TRUE(brighter.value().phash.has_value());

    EXPECT_EQ(original.value().phash->size(), 16u);
    EXPECT_NE(original.value().sha256, brighter.value().sha256);
    EXPECT_LE(hamming_distance(*original.value().phash, *brighter.value().phash), 4);

    auto again = engine.fingerprint(dir / "a.png", "image/png");
    EXPECT_EQ(again.value().phash, original.value().phash);
}

TEST(FingerprintTest, HammingDistance) {
    EXPECT_EQ(hamming_distance("0000000000000000", "0000000000000000"), 0);
    EXPECT_EQ(hamming_distance("0000000000000000", "000000000000000f"), 4);
    EXPECT_EQ(hamming_distance("ffffffffffffffff", "0000000000000000"), 64);
    EXPECT_EQ(hamming_distance("ABCDEF0000000000", "abcdef0000000000"), 0);
    EXPECT_EQ(hamming_distance("00", "000"), -1);
    EXPECT_EQ(hamming_distance("zz", "00"), -1);
    EXPECT_EQ(hamming_distance("", ""), -1);
}
