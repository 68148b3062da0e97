#include "vault/intake/manifest_batcher.hpp"

#include "vault/core/ids.hpp"
#include "vault/events/events.hpp"
#include "vault/model/json.hpp"
#include "vault/storage/local_blob_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <regex>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace vault::intake;
using vault::ErrorCode;
using vault::model::ManifestFile;
using vault::storage::LocalBlobStore;
using vault::storage::Location;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("vault_batcher_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

class ManifestBatcherTest : public ::testing::Test {
protected:
    ManifestBatcherTest()
        : store(create_temp_dir())
        , contributors({{"tok-mary", "Aunt Mary"}, {"tok-joe", "Uncle Joe"}})
        , batcher(vault::config::BatchConfig{3}, store, state, contributors, &bus) {
        EXPECT_TRUE(store.initialize().is_ok());
    }

    std::string new_batch(const std::string& token = "tok-mary") {
        auto id = batcher.create_batch(token);
        EXPECT_TRUE(id.is_ok());
        return id.is_ok() ? id.value() : std::string();
    }

    vault::model::Manifest read_manifest(const std::string& manifest_id) {
        auto bytes = store.read(manifest_id);
        EXPECT_TRUE(bytes.is_ok());
        const auto j = vault::model::json::parse(std::string(bytes.value().begin(), bytes.value().end()));
        return vault::model::manifest_from_json(j).value();
    }

    LocalBlobStore store;
    MemoryIntakeStore state;
    ContributorRegistry contributors;
    vault::events::EventBus bus;
    ManifestBatcher batcher;
};

} // namespace

TEST(BatchIdTest, Format) {
    const std::time_t when = vault::parse_iso8601("2024-05-06T07:08:09Z");
    const std::string id = ManifestBatcher::make_batch_id(when);
    EXPECT_TRUE(std::regex_match(id, std::regex("batch_20240506_070809_[0-9a-f]{8}"))) << id;
    EXPECT_NE(ManifestBatcher::make_batch_id(when), id);
}

TEST_F(ManifestBatcherTest, CreateRequiresKnownToken) {
    auto bad = batcher.create_batch("tok-stranger");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidToken);

    const std::string id = new_batch();
    auto stored = state.get_batch(id).value();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->contributor_token, "tok-mary");
    EXPECT_FALSE(stored->finalized);
}

TEST_F(ManifestBatcherTest, FinishWritesManifestOnce) {
    int finished_events = 0;
    bus.subscribe<vault::events::BatchFinishedEvent>([&finished_events](const vault::events::BatchFinishedEvent& e) {
        ++finished_events;
        EXPECT_EQ(e.total_bytes, 30u);
    });

    const std::string id = new_batch();
    FinishBatchRequest request;
    request.contributor_token = "tok-mary";
    request.batch_id = id;
    request.files = {{"o1", "a.jpg", 10}, {"o2", "b.jpg", 20}};
    request.context.decade = "1980s";
    request.context.event = "Wedding";

    auto ack = batcher.finish_batch(request);
    ASSERT_TRUE(ack.is_ok()) << ack.error().message;
    EXPECT_EQ(ack.value().batch_id, id);
    EXPECT_EQ(ack.value().total_files, 2u);
    EXPECT_EQ(finished_events, 1);

    auto info = store.stat(ack.value().manifest_id);
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().location, Location::Manifests);
    EXPECT_EQ(info.value().name, id + ".json");

    const auto manifest = read_manifest(ack.value().manifest_id);
    EXPECT_EQ(manifest.contributor_name, "Aunt Mary");
    EXPECT_EQ(manifest.context.event, std::optional<std::string>("Wedding"));
    ASSERT_EQ(manifest.files.size(), 2u);
    EXPECT_EQ(manifest.files[1].origin_file_id, "o2");

    auto again = batcher.finish_batch(request);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::BatchFinalized);
    EXPECT_EQ(store.list(Location::Manifests).value().size(), 1u);
}

TEST_F(ManifestBatcherTest, FallsBackToRecordedUploads) {
    const std::string id = new_batch();
    ASSERT_TRUE(state.append_batch_file(id, ManifestFile{"up-1", "clip.mp4", 500}).is_ok());

    FinishBatchRequest request;
    request.contributor_token = "tok-mary";
    request.batch_id = id;

    auto ack = batcher.finish_batch(request);
    ASSERT_TRUE(ack.is_ok());
    EXPECT_EQ(ack.value().total_files, 1u);
    EXPECT_EQ(read_manifest(ack.value().manifest_id).files[0].origin_file_id, "up-1");
}

TEST_F(ManifestBatcherTest, RejectsTooManyFiles) {
    const std::string id = new_batch();
    FinishBatchRequest request;
    request.contributor_token = "tok-mary";
    request.batch_id = id;
    request.files = {{"1", "", 1}, {"2", "", 1}, {"3", "", 1}, {"4", "", 1}};

    auto ack = batcher.finish_batch(request);
    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().code, ErrorCode::TooManyFiles);
    EXPECT_FALSE(state.get_batch(id).value()->finalized);
    EXPECT_TRUE(store.list(Location::Manifests).value().empty());
}

TEST_F(ManifestBatcherTest, OtherContributorsBatchIsUnknown) {
    const std::string id = new_batch("tok-joe");
    FinishBatchRequest request;
    request.contributor_token = "tok-mary";
    request.batch_id = id;
    EXPECT_EQ(batcher.finish_batch(request).error().code, ErrorCode::UnknownBatch);

    request.batch_id = "batch_missing";
    EXPECT_EQ(batcher.finish_batch(request).error().code, ErrorCode::UnknownBatch);

    request.contributor_token = "tok-stranger";
    EXPECT_EQ(batcher.finish_batch(request).error().code, ErrorCode::InvalidToken);
}

TEST_F(ManifestBatcherTest, ConcurrentFinishWritesOneManifest) {
    const std::string id = new_batch();
    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            FinishBatchRequest request;
            request.contributor_token = "tok-mary";
            request.batch_id = id;
            auto ack = batcher.finish_batch(request);
            if (ack.is_ok()) {
                ++succeeded;
            } else if (ack.error().code == ErrorCode::BatchFinalized) {
                ++rejected;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(rejected.load(), 3);
    EXPECT_EQ(store.list(Location::Manifests).value().size(), 1u);
}
