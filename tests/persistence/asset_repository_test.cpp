#include "vault/persistence/asset_repository.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace vault::persistence;
using vault::model::Asset;
using vault::model::AssetStatus;
using vault::model::DuplicateMethod;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("vault_repo_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

Asset make_asset(const std::string& id, const std::string& origin, std::time_t created_at = 1000) {
    Asset asset;
    asset.asset_id = id;
    asset.origin_file_id = origin;
    asset.contributor_token = "tok";
    asset.original_filename = origin + ".jpg";
    asset.mime_type = "image/jpeg";
    asset.size_bytes = 42;
    asset.status = AssetStatus::Processing;
    asset.created_at = created_at;
    return asset;
}

class AssetRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(repo.migrate().is_ok());
    }

    Database db{":memory:"};
    AssetRepository repo{db};
};

} // namespace

TEST_F(AssetRepositoryTest, ClaimIsIdempotentPerOrigin) {
    auto first = repo.claim(make_asset("a1", "origin-1"));
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value());

    auto second = repo.claim(make_asset("a2", "origin-1"));
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(second.value());

    auto found = repo.find_by_origin("origin-1");
    ASSERT_TRUE(found.is_ok());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->asset_id, "a1");
    EXPECT_FALSE(repo.find("a2").value().has_value());
}

TEST_F(AssetRepositoryTest, UpdateRoundTripsOptionalColumns) {
    Asset asset = make_asset("a1", "o1");
    ASSERT_TRUE(repo.claim(asset).value());

    asset.sha256 = "abc";
    asset.phash = "00000000000000ff";
    asset.caption = "grandpa on a boat";
    asset.duration_seconds = 12.5;
    asset.faces_count = 3;
    asset.status = AssetStatus::NeedsReview;
    ASSERT_TRUE(repo.update(asset).is_ok());

    const Asset stored = *repo.find("a1").value();
    EXPECT_EQ(stored.sha256, "abc");
    EXPECT_EQ(stored.phash, std::optional<std::string>("00000000000000ff"));
    EXPECT_EQ(stored.caption, std::optional<std::string>("grandpa on a boat"));
    EXPECT_EQ(stored.duration_seconds, std::optional<double>(12.5));
    EXPECT_EQ(stored.faces_count, 3u);
    EXPECT_EQ(stored.status, AssetStatus::NeedsReview);
    EXPECT_FALSE(stored.event.has_value());
    EXPECT_FALSE(stored.exif_date.has_value());
    EXPECT_FALSE(stored.gps_lat.has_value());
}

TEST_F(AssetRepositoryTest, UpdateRoundTripsExifColumns) {
    Asset asset = make_asset("a1", "o1");
    ASSERT_TRUE(repo.claim(asset).value());

    asset.exif_date = "1974:07:04 12:30:00";
    asset.decade_estimate = "1970s";
    asset.decade_confidence = 0.6;
    asset.gps_lat = 51.5;
    asset.gps_lon = -0.125;
    ASSERT_TRUE(repo.update(asset).is_ok());

    const Asset stored = *repo.find("a1").value();
    EXPECT_EQ(stored.exif_date, std::optional<std::string>("1974:07:04 12:30:00"));
    EXPECT_EQ(stored.decade_estimate, std::optional<std::string>("1970s"));
    EXPECT_EQ(stored.decade_confidence, std::optional<double>(0.6));
    EXPECT_EQ(stored.gps_lat, std::optional<double>(51.5));
    EXPECT_EQ(stored.gps_lon, std::optional<double>(-0.125));
}

TEST_F(AssetRepositoryTest, UpdateOfMissingAssetIsStorageError) {
    auto r = repo.update(make_asset("ghost", "nowhere"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, vault::ErrorCode::Storage);
}

TEST_F(AssetRepositoryTest, RecordOutcomeWritesAssetAndLink) {
    Asset original = make_asset("a1", "o1", 100);
    original.sha256 = "same";
    original.status = AssetStatus::NeedsReview;
    ASSERT_TRUE(repo.claim(original).value());

    Asset copy = make_asset("a2", "o2", 200);
    ASSERT_TRUE(repo.claim(copy).value());
    copy.sha256 = "same";
    copy.status = AssetStatus::PossibleDuplicate;
    copy.duplicate_of = "a1";
    copy.duplicate_method = DuplicateMethod::Exact;

    vault::model::DuplicateLink link{"a2", "a1", DuplicateMethod::Exact, 0, 200};
    ASSERT_TRUE(repo.record_outcome(copy, link).is_ok());
    // Reprocessing records the same link once
    ASSERT_TRUE(repo.record_outcome(copy, link).is_ok());

    auto links = repo.duplicates_of("a2");
    ASSERT_TRUE(links.is_ok());
    ASSERT_EQ(links.value().size(), 1u);
    EXPECT_EQ(links.value()[0].duplicate_of, "a1");

    const Asset stored = *repo.find("a2").value();
    EXPECT_EQ(stored.status, AssetStatus::PossibleDuplicate);
    EXPECT_EQ(stored.duplicate_method, DuplicateMethod::Exact);
}

TEST_F(AssetRepositoryTest, RecordOutcomeRollsBackOnBadLink) {
    Asset asset = make_asset("a1", "o1");
    ASSERT_TRUE(repo.claim(asset).value());
    asset.status = AssetStatus::PossibleDuplicate;

    // duplicate_of references an asset that does not exist
    vault::model::DuplicateLink link{"a1", "missing", DuplicateMethod::Near, 3, 1};
    auto r = repo.record_outcome(asset, link);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(repo.find("a1").value()->status, AssetStatus::Processing);
}

TEST_F(AssetRepositoryTest, FingerprintQueriesAreOrdered) {
    Asset later = make_asset("b", "o-b", 300);
    later.sha256 = "s";
    later.phash = "0000000000000000";
    Asset earlier = make_asset("c", "o-c", 100);
    earlier.sha256 = "s";
    Asset same_time = make_asset("a", "o-a", 300);
    same_time.sha256 = "other";
    same_time.phash = "ffffffffffffffff";
    ASSERT_TRUE(repo.claim(later).value());
    ASSERT_TRUE(repo.claim(earlier).value());
    ASSERT_TRUE(repo.claim(same_time).value());

    auto by_sha = repo.find_by_sha256("s");
    ASSERT_TRUE(by_sha.is_ok());
    ASSERT_EQ(by_sha.value().size(), 2u);
    EXPECT_EQ(by_sha.value()[0].asset_id, "c");

    auto hashed = repo.with_phash();
    ASSERT_TRUE(hashed.is_ok());
    ASSERT_EQ(hashed.value().size(), 2u);
    EXPECT_EQ(hashed.value()[0].asset_id, "a");
    EXPECT_EQ(hashed.value()[1].asset_id, "b");
}

TEST_F(AssetRepositoryTest, ClaimOrderFollowsInsertion) {
    // created_at runs backwards; claim order does not
    ASSERT_TRUE(repo.claim(make_asset("z", "o-z", 500)).value());
    ASSERT_TRUE(repo.claim(make_asset("a", "o-a", 100)).value());

    auto first = repo.claim_order("z");
    auto second = repo.claim_order("a");
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    ASSERT_TRUE(first.value().has_value());
    ASSERT_TRUE(second.value().has_value());
    EXPECT_LT(*first.value(), *second.value());
    EXPECT_FALSE(repo.claim_order("ghost").value().has_value());

    Asset z = *repo.find("z").value();
    z.sha256 = "s";
    ASSERT_TRUE(repo.update(z).is_ok());
    auto by_sha = repo.find_by_sha256("s");
    ASSERT_EQ(by_sha.value().size(), 1u);
    EXPECT_EQ(by_sha.value()[0].claim_order, *first.value());
}

TEST_F(AssetRepositoryTest, InterruptedAssetsBecomeErrors) {
    ASSERT_TRUE(repo.claim(make_asset("a1", "o1")).value());
    Asset done = make_asset("a2", "o2");
    done.status = AssetStatus::NeedsReview;
    ASSERT_TRUE(repo.claim(done).value());

    EXPECT_EQ(repo.processing_backlog().value(), 1u);
    auto changed = repo.fail_interrupted("interrupted by restart");
    ASSERT_TRUE(changed.is_ok());
    EXPECT_EQ(changed.value(), 1u);

    const Asset failed = *repo.find("a1").value();
    EXPECT_EQ(failed.status, AssetStatus::Error);
    EXPECT_EQ(failed.last_error, "interrupted by restart");
    EXPECT_EQ(repo.processing_backlog().value(), 0u);

    auto counts = repo.count_by_status();
    ASSERT_TRUE(counts.is_ok());
    EXPECT_EQ(counts.value().at("error"), 1u);
    EXPECT_EQ(counts.value().at("needs_review"), 1u);
    EXPECT_EQ(repo.list_by_status(AssetStatus::Error).value().size(), 1u);
}

TEST_F(AssetRepositoryTest, BatchReconciliationIsKeyedByManifest) {
    vault::model::BatchRecord batch;
    batch.batch_id = "batch_1";
    batch.contributor_token = "tok";
    batch.created_at = 5;
    batch.context.decade = "1990s";
    batch.manifest_id = "m1";

    EXPECT_TRUE(repo.reconcile_batch(batch).value());
    EXPECT_FALSE(repo.reconcile_batch(batch).value());
    EXPECT_TRUE(repo.manifest_reconciled("m1").value());
    EXPECT_FALSE(repo.manifest_reconciled("m2").value());

    auto found = repo.find_batch("batch_1");
    ASSERT_TRUE(found.is_ok());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->context.decade, std::optional<std::string>("1990s"));
    EXPECT_FALSE(found.value()->context.event.has_value());
}

TEST_F(AssetRepositoryTest, LogAndOpsState) {
    ASSERT_TRUE(repo.append_log("a1", "fingerprint", "ok", "").is_ok());
    ASSERT_TRUE(repo.append_log("a1", "dedup", "ok", "exact").is_ok());
    auto log = repo.log_for("a1");
    ASSERT_TRUE(log.is_ok());
    ASSERT_EQ(log.value().size(), 2u);
    EXPECT_EQ(log.value()[1].step, "dedup");

    EXPECT_FALSE(repo.get_state("last_worker_run").value().has_value());
    ASSERT_TRUE(repo.set_state("last_worker_run", "2024-01-01T00:00:00Z").is_ok());
    ASSERT_TRUE(repo.set_state("last_worker_run", "2024-01-02T00:00:00Z").is_ok());
    EXPECT_EQ(repo.get_state("last_worker_run").value(), std::optional<std::string>("2024-01-02T00:00:00Z"));
}

TEST(AssetRepositoryFileTest, SurvivesReopen) {
    const fs::path path = create_temp_dir() / "vault.db";
    {
        Database db(path.string());
        AssetRepository repo(db);
        ASSERT_TRUE(repo.migrate().is_ok());
        ASSERT_TRUE(repo.claim(make_asset("a1", "o1")).value());
    }

    Database db(path.string());
    AssetRepository repo(db);
    ASSERT_TRUE(repo.migrate().is_ok());
    EXPECT_TRUE(repo.find("a1").value().has_value());
}

TEST(AssetRepositoryFileTest, MigrationAddsExifColumnsToOlderDatabase) {
    const fs::path path = create_temp_dir() / "vault.db";
    {
        Database db(path.string());
        db.exec(
            "CREATE TABLE assets ("
            " asset_id TEXT PRIMARY KEY, origin_file_id TEXT NOT NULL UNIQUE,"
            " contributor_token TEXT NOT NULL DEFAULT '', batch_id TEXT NOT NULL DEFAULT '',"
            " original_filename TEXT NOT NULL DEFAULT '', mime_type TEXT NOT NULL DEFAULT '',"
            " size_bytes INTEGER NOT NULL DEFAULT 0, sha256 TEXT NOT NULL DEFAULT '', phash TEXT,"
            " status TEXT NOT NULL, duplicate_of TEXT, duplicate_method TEXT, decade_estimate TEXT,"
            " event TEXT, notes TEXT, caption TEXT, faces_count INTEGER NOT NULL DEFAULT 0,"
            " embedding_ref TEXT, transcript_ref TEXT, duration_seconds REAL,"
            " attempts INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '',"
            " created_at INTEGER NOT NULL, processed_at INTEGER NOT NULL DEFAULT 0);"
            "INSERT INTO assets (asset_id, origin_file_id, status, created_at)"
            " VALUES ('old', 'o-old', 'needs_review', 10);");
    }

    Database db(path.string());
    AssetRepository repo(db);
    ASSERT_TRUE(repo.migrate().is_ok());
    // Running it twice finds the columns in place
    ASSERT_TRUE(repo.migrate().is_ok());

    Asset old = *repo.find("old").value();
    EXPECT_EQ(old.status, AssetStatus::NeedsReview);
    EXPECT_FALSE(old.exif_date.has_value());

    old.gps_lat = -33.9;
    ASSERT_TRUE(repo.update(old).is_ok());
    EXPECT_EQ(repo.find("old").value()->gps_lat, std::optional<double>(-33.9));
}
