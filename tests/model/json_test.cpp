#include "vault/core/ids.hpp"
#include "vault/model/json.hpp"

#include <gtest/gtest.h>

using namespace vault::model;
using vault::ErrorCode;

TEST(ManifestJsonTest, WritesSnakeCaseDocument) {
    Manifest manifest;
    manifest.batch_id = "batch_20240101_120000_0a1b2c3d";
    manifest.contributor_token = "tok-1";
    manifest.contributor_name = "Aunt Mary";
    manifest.created_at = vault::parse_iso8601("2024-01-01T12:00:00Z");
    manifest.finished_at = vault::parse_iso8601("2024-01-01T12:30:00Z");
    manifest.context.decade = "1980s";
    manifest.context.event = "Wedding";
    manifest.files = {{"f1", "a.jpg", 100}, {"f2", "b.mp4", 250}};

    const json j = to_json(manifest);
    EXPECT_EQ(j["batch_id"], manifest.batch_id);
    EXPECT_EQ(j["contributor_display_name"], "Aunt Mary");
    EXPECT_EQ(j["created_at"], "2024-01-01T12:00:00Z");
    EXPECT_EQ(j["total_files"], 2);
    EXPECT_EQ(j["total_bytes"], 350);
    EXPECT_EQ(j["context"]["event"], "Wedding");
    EXPECT_TRUE(j["context"]["notes"].is_null());
    EXPECT_EQ(j["files"][1]["origin_file_id"], "f2");

    auto parsed = manifest_from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().finished_at, manifest.finished_at);
    EXPECT_EQ(parsed.value().files.size(), 2u);
    EXPECT_EQ(parsed.value().context.decade, std::optional<std::string>("1980s"));
}

TEST(ManifestJsonTest, AcceptsClientSpellings) {
    const json files = json::parse(R"([
        {"originFileID": "x1", "name": "cat.png", "sizeBytes": 12},
        {"drive_file_id": "x2", "originalName": "dog.png"}
    ])");

    auto parsed = manifest_files_from_json(files);
    ASSERT_TRUE(parsed.is_ok());
    ASSERT_EQ(parsed.value().size(), 2u);
    EXPECT_EQ(parsed.value()[0].origin_file_id, "x1");
    EXPECT_EQ(parsed.value()[0].size_bytes, 12u);
    EXPECT_EQ(parsed.value()[1].original_name, "dog.png");
    EXPECT_EQ(parsed.value()[1].size_bytes, 0u);
}

TEST(ManifestJsonTest, RejectsBadEntries) {
    auto missing_id = manifest_files_from_json(json::parse(R"([{"name": "a.jpg"}])"));
    ASSERT_TRUE(missing_id.is_error());
    EXPECT_EQ(missing_id.error().code, ErrorCode::InvalidArgument);

    auto negative = manifest_files_from_json(json::parse(R"([{"origin_file_id": "a", "size": -3}])"));
    ASSERT_TRUE(negative.is_error());

    auto not_array = manifest_files_from_json(json::parse(R"({"origin_file_id": "a"})"));
    ASSERT_TRUE(not_array.is_error());
}

TEST(ContextJsonTest, NormalizesNumericDecade) {
    const BatchContext context = context_from_json(json::parse(R"({"decade": 1970, "eventName": "Reunion"})"));
    EXPECT_EQ(context.decade, std::optional<std::string>("1970s"));
    EXPECT_EQ(context.event, std::optional<std::string>("Reunion"));
    EXPECT_FALSE(context.notes.has_value());
}

TEST(SidecarJsonTest, CarriesAssetAndEnrichment) {
    Asset asset;
    asset.asset_id = "a1";
    asset.origin_file_id = "o1";
    asset.sha256 = std::string(64, 'a');
    asset.status = AssetStatus::PossibleDuplicate;
    asset.duplicate_of = "a0";
    asset.duplicate_method = DuplicateMethod::Near;
    asset.created_at = vault::parse_iso8601("2024-03-01T00:00:00Z");

    EnrichmentResult enrichment;
    enrichment.caption = "a dog";
    enrichment.faces.push_back(DetectedFace{{1, 2, 3, 4}, 0.9});
    enrichment.errors.push_back("transcript: model missing");

    const json j = sidecar_json(asset, enrichment);
    EXPECT_EQ(j["schema_version"], kSidecarSchemaVersion);
    EXPECT_EQ(j["status"], "possible_duplicate");
    EXPECT_EQ(j["duplicate_method"], "near");
    EXPECT_EQ(j["caption"], "a dog");
    EXPECT_EQ(j["faces_count"], 1);
    EXPECT_EQ(j["errors"].size(), 1u);
    EXPECT_TRUE(j["phash"].is_null());
    EXPECT_EQ(j["processing"]["created_at"], "2024-03-01T00:00:00Z");
    EXPECT_TRUE(j["exif_date"].is_null());
    EXPECT_TRUE(j["gps"]["lat"].is_null());
    EXPECT_TRUE(j["decade_confidence"].is_null());
}

TEST(SidecarJsonTest, CarriesCaptureMetadata) {
    Asset asset;
    asset.asset_id = "a2";
    asset.exif_date = "1974:07:04 12:30:00";
    asset.decade_estimate = "1970s";
    asset.decade_confidence = 0.6;
    asset.gps_lat = 51.5;
    asset.gps_lon = -0.125;

    const json j = sidecar_json(asset, EnrichmentResult{});
    EXPECT_EQ(j["exif_date"], "1974:07:04 12:30:00");
    EXPECT_EQ(j["decade_estimate"], "1970s");
    EXPECT_DOUBLE_EQ(j["decade_confidence"].get<double>(), 0.6);
    EXPECT_DOUBLE_EQ(j["gps"]["lat"].get<double>(), 51.5);
    EXPECT_DOUBLE_EQ(j["gps"]["lon"].get<double>(), -0.125);
}

TEST(StatusTest, ParsesCurationSpellings) {
    EXPECT_EQ(status_from_string("pending"), AssetStatus::NeedsReview);
    EXPECT_EQ(status_from_string("possible_duplicates"), AssetStatus::PossibleDuplicate);
    EXPECT_EQ(status_from_string("TRANSCRIBE_LATER"), AssetStatus::TranscribeLater);
    EXPECT_FALSE(status_from_string("lost").has_value());
    EXPECT_EQ(media_kind_from_mime("Video/MP4"), MediaKind::Video);
    EXPECT_EQ(media_kind_from_mime("application/pdf"), MediaKind::Other);
}
