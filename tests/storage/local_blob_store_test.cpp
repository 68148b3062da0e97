#include "vault/storage/local_blob_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace vault::storage;
using vault::ErrorCode;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("vault_blob_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

} // namespace

TEST(LocalBlobStoreTest, LocationNames) {
    EXPECT_EQ(to_string(Location::NeedsReview), "holding/needs_review");
    EXPECT_EQ(location_from_string("holding/possible_duplicates"), Location::PossibleDuplicates);
    EXPECT_FALSE(location_from_string("holding/elsewhere").has_value());
}

TEST(LocalBlobStoreTest, UploadStatReadAndMove) {
    LocalBlobStore store(create_temp_dir());
    ASSERT_TRUE(store.initialize().is_ok());

    auto id = store.upload(Location::Inbox, "note.txt", bytes_of("hello"), "text/plain");
    ASSERT_TRUE(id.is_ok()) << id.error().message;

    auto info = store.stat(id.value());
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().name, "note.txt");
    EXPECT_EQ(info.value().size_bytes, 5u);
    EXPECT_EQ(info.value().location, Location::Inbox);

    ASSERT_TRUE(store.move(id.value(), Location::NeedsReview).is_ok());
    EXPECT_EQ(store.stat(id.value()).value().location, Location::NeedsReview);
    EXPECT_TRUE(store.list(Location::Inbox).value().empty());
    ASSERT_EQ(store.list(Location::NeedsReview).value().size(), 1u);

    auto content = store.read(id.value());
    ASSERT_TRUE(content.is_ok());
    EXPECT_EQ(content.value(), bytes_of("hello"));

    const fs::path dest = create_temp_dir() / "copy" / "note.txt";
    ASSERT_TRUE(store.download(id.value(), dest).is_ok());
    EXPECT_EQ(read_file(dest), "hello");
}

TEST(LocalBlobStoreTest, UnknownBlobIsNotFound) {
    LocalBlobStore store(create_temp_dir());
    ASSERT_TRUE(store.initialize().is_ok());

    auto info = store.stat("abcdef");
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().code, ErrorCode::NotFound);

    EXPECT_EQ(store.stat("../etc/passwd").error().code, ErrorCode::NotFound);
}

TEST(LocalBlobStoreTest, RemoveDeletesOnlyThatBlob) {
    LocalBlobStore store(create_temp_dir());
    ASSERT_TRUE(store.initialize().is_ok());

    auto first = store.upload(Location::Sidecars, "a.json", bytes_of("{}"), "application/json");
    auto second = store.upload(Location::Sidecars, "a.json", bytes_of("{\"v\":2}"), "application/json");
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    ASSERT_TRUE(store.remove(first.value()).is_ok());
    EXPECT_EQ(store.stat(first.value()).error().code, ErrorCode::NotFound);
    ASSERT_EQ(store.list(Location::Sidecars).value().size(), 1u);
    EXPECT_EQ(store.read(second.value()).value(), bytes_of("{\"v\":2}"));

    auto again = store.remove(first.value());
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST(LocalBlobStoreTest, ResumableSessionAppendsInOrder) {
    LocalBlobStore store(create_temp_dir());
    ASSERT_TRUE(store.initialize().is_ok());

    ResumableMeta meta;
    meta.name = "clip.bin";
    meta.mime_type = "application/octet-stream";
    meta.total_bytes = 6;
    auto handle = store.create_resumable_session(meta);
    ASSERT_TRUE(handle.is_ok());

    const std::string first = "abc";
    const std::string second = "def";
    ASSERT_TRUE(store.append_range(handle.value(), 0,
                                   reinterpret_cast<const std::uint8_t*>(first.data()), first.size()).is_ok());
    EXPECT_EQ(store.query_received_bytes(handle.value()).value(), 3u);

    // Replaying the first chunk is rejected, nothing is written twice
    auto replay = store.append_range(handle.value(), 0,
                                     reinterpret_cast<const std::uint8_t*>(first.data()), first.size());
    ASSERT_TRUE(replay.is_error());
    EXPECT_EQ(replay.error().code, ErrorCode::InvalidRange);
    EXPECT_EQ(store.query_received_bytes(handle.value()).value(), 3u);

    auto early = store.finalize_resumable(handle.value());
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().code, ErrorCode::InvalidRange);

    ASSERT_TRUE(store.append_range(handle.value(), 3,
                                   reinterpret_cast<const std::uint8_t*>(second.data()), second.size()).is_ok());
    auto id = store.finalize_resumable(handle.value());
    ASSERT_TRUE(id.is_ok()) << id.error().message;

    EXPECT_EQ(store.read(id.value()).value(), bytes_of("abcdef"));
    EXPECT_EQ(store.stat(id.value()).value().location, Location::Inbox);
    EXPECT_TRUE(store.query_received_bytes(handle.value()).is_error());
}

TEST(LocalBlobStoreTest, AppendPastDeclaredSizeIsRejected) {
    LocalBlobStore store(create_temp_dir());
    ASSERT_TRUE(store.initialize().is_ok());

    ResumableMeta meta;
    meta.total_bytes = 2;
    auto handle = store.create_resumable_session(meta);
    ASSERT_TRUE(handle.is_ok());

    const std::string data = "xyz";
    auto r = store.append_range(handle.value(), 0, reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidRange);
}

TEST(LocalBlobStoreTest, AbortDropsSession) {
    LocalBlobStore store(create_temp_dir());
    ASSERT_TRUE(store.initialize().is_ok());

    auto handle = store.create_resumable_session(ResumableMeta{"a", "text/plain", 4, Location::Inbox});
    ASSERT_TRUE(handle.is_ok());
    ASSERT_TRUE(store.abort_resumable(handle.value()).is_ok());
    EXPECT_EQ(store.query_received_bytes(handle.value()).error().code, ErrorCode::NotFound);
}
