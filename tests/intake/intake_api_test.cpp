#include "vault/intake/intake_api.hpp"

#include "vault/storage/local_blob_store.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace vault::intake;
using namespace vault::network;
using json = nlohmann::json;
using vault::storage::LocalBlobStore;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("vault_api_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

json body_of(const HttpResponse& response) {
    return json::parse(std::string(response.body.begin(), response.body.end()));
}

class IntakeApiTest : public ::testing::Test {
protected:
    IntakeApiTest()
        : root(create_temp_dir())
        , store(root / "blobs")
        , contributors(std::map<std::string, std::string>{{"tok-mary", "Aunt Mary"}})
        , sessions(vault::config::UploadConfig{}, store, state, contributors)
        , batcher(vault::config::BatchConfig{}, store, state, contributors)
        , repo(db)
        , api(sessions, batcher, &repo, root) {
        EXPECT_TRUE(store.initialize().is_ok());
        EXPECT_TRUE(repo.migrate().is_ok());
        api.register_routes(router);
    }

    HttpResponse post(const std::string& url, const json& body) {
        HttpRequest request;
        request.method = HttpMethod::POST;
        request.url = url;
        const std::string text = body.dump();
        request.body.assign(text.begin(), text.end());
        return router.handle_request(request);
    }

    HttpResponse put_chunk(const std::string& session_id, const std::string& content_range,
                           const std::string& payload) {
        HttpRequest request;
        request.method = HttpMethod::PUT;
        request.url = "/upload/chunk";
        if (!session_id.empty()) {
            request.headers["X-Upload-Session-ID"] = session_id;
        }
        if (!content_range.empty()) {
            request.headers["Content-Range"] = content_range;
        }
        request.body.assign(payload.begin(), payload.end());
        return router.handle_request(request);
    }

    HttpResponse get(const std::string& url) {
        HttpRequest request;
        request.method = HttpMethod::GET;
        request.url = url;
        return router.handle_request(request);
    }

    std::string init(std::uint64_t size, const std::string& batch_id = "") {
        json body{{"contributorToken", "tok-mary"}, {"filename", "note.txt"},
                  {"mimeType", "text/plain"}, {"sizeBytes", size}};
        if (!batch_id.empty()) {
            body["batchID"] = batch_id;
        }
        auto response = post("/upload/init", body);
        EXPECT_EQ(response.status_code, 200);
        return body_of(response).value("sessionID", "");
    }

    fs::path root;
    LocalBlobStore store;
    MemoryIntakeStore state;
    ContributorRegistry contributors;
    SessionManager sessions;
    ManifestBatcher batcher;
    vault::persistence::Database db{":memory:"};
    vault::persistence::AssetRepository repo;
    IntakeApi api;
    HttpRouter router;
};

} // namespace

TEST(IntakeApiStatusTest, ErrorCodesMapToHttp) {
    using vault::ErrorCode;
    EXPECT_EQ(IntakeApi::status_for(ErrorCode::InvalidToken), HttpStatus::UNAUTHORIZED);
    EXPECT_EQ(IntakeApi::status_for(ErrorCode::FileTooLarge), HttpStatus::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(IntakeApi::status_for(ErrorCode::UnknownSession), HttpStatus::NOT_FOUND);
    EXPECT_EQ(IntakeApi::status_for(ErrorCode::BatchFinalized), HttpStatus::CONFLICT);
    EXPECT_EQ(IntakeApi::status_for(ErrorCode::InvalidRange), HttpStatus::RANGE_NOT_SATISFIABLE);
    EXPECT_EQ(IntakeApi::status_for(ErrorCode::Storage), HttpStatus::INTERNAL_SERVER_ERROR);

    auto transient = IntakeApi::error_response(vault::Error(ErrorCode::Transient, "busy"));
    EXPECT_EQ(transient.status_code, 503);
    EXPECT_EQ(transient.headers.at("Retry-After"), "1");
    EXPECT_EQ(body_of(transient)["message"], "busy");
}

TEST_F(IntakeApiTest, UploadInTwoChunks) {
    const std::string session_id = init(10);
    ASSERT_EQ(session_id.size(), 36u);

    auto partial = put_chunk(session_id, "bytes 0-5/10", "hello ");
    EXPECT_EQ(partial.status_code, 308);
    EXPECT_EQ(partial.headers.at("Range"), "bytes=0-5");
    EXPECT_EQ(body_of(partial)["nextOffset"], 6);

    auto probe = put_chunk(session_id, "bytes */10", "");
    EXPECT_EQ(probe.status_code, 308);
    EXPECT_EQ(probe.headers.at("Range"), "bytes=0-5");

    auto done = put_chunk(session_id, "bytes 6-9/10", "mary");
    ASSERT_EQ(done.status_code, 200);
    const auto origin = body_of(done)["originFileID"].get<std::string>();
    auto content = store.read(origin);
    ASSERT_TRUE(content.is_ok());
    EXPECT_EQ(std::string(content.value().begin(), content.value().end()), "hello mary");
}

TEST_F(IntakeApiTest, ProbeWithoutRangeBeforeAnyBytes) {
    const std::string session_id = init(4);
    auto probe = put_chunk(session_id, "", "");
    EXPECT_EQ(probe.status_code, 308);
    EXPECT_EQ(probe.headers.count("Range"), 0u);
    EXPECT_EQ(body_of(probe)["nextOffset"], 0);
}

TEST_F(IntakeApiTest, InitErrors) {
    auto bad_token = post("/upload/init", json{{"contributorToken", "nope"}, {"filename", "a"}, {"sizeBytes", 1}});
    EXPECT_EQ(bad_token.status_code, 401);
    EXPECT_EQ(body_of(bad_token)["error"], "InvalidToken");

    auto negative = post("/upload/init", json{{"contributorToken", "tok-mary"}, {"filename", "a"}, {"sizeBytes", -1}});
    EXPECT_EQ(negative.status_code, 400);

    auto textual = post("/upload/init", json{{"contributorToken", "tok-mary"}, {"filename", "a"}, {"sizeBytes", "12"}});
    EXPECT_EQ(textual.status_code, 400);

    auto huge = post("/upload/init", json{{"contributorToken", "tok-mary"}, {"filename", "a"},
                                          {"sizeBytes", sessions.config().max_file_bytes + 1}});
    EXPECT_EQ(huge.status_code, 413);

    HttpRequest garbage;
    garbage.method = HttpMethod::POST;
    garbage.url = "/upload/init";
    const std::string text = "{not json";
    garbage.body.assign(text.begin(), text.end());
    EXPECT_EQ(router.handle_request(garbage).status_code, 400);
}

TEST_F(IntakeApiTest, ChunkErrors) {
    EXPECT_EQ(put_chunk("", "bytes 0-0/1", "x").status_code, 400);
    EXPECT_EQ(put_chunk("missing", "bytes 0-0/1", "x").status_code, 404);

    const std::string session_id = init(10);
    EXPECT_EQ(put_chunk(session_id, "bytes zero-one/10", "xy").status_code, 400);
    EXPECT_EQ(put_chunk(session_id, "", "payload without range").status_code, 400);
    EXPECT_EQ(put_chunk(session_id, "bytes 0-1/11", "xy").status_code, 416);
    EXPECT_EQ(put_chunk(session_id, "bytes 0-3/10", "xy").status_code, 416);
}

TEST_F(IntakeApiTest, BatchFlow) {
    auto created = post("/batch/create", json{{"contributorToken", "tok-mary"}});
    ASSERT_EQ(created.status_code, 200);
    const auto batch_id = body_of(created)["batchID"].get<std::string>();

    const std::string session_id = init(3, batch_id);
    ASSERT_EQ(put_chunk(session_id, "bytes 0-2/3", "abc").status_code, 200);

    auto finished = post("/batch/finish", json{
        {"contributorToken", "tok-mary"},
        {"batchID", batch_id},
        {"context", {{"decade", 1970}, {"event", "Picnic"}}}
    });
    ASSERT_EQ(finished.status_code, 200);
    const json ack = body_of(finished);
    EXPECT_EQ(ack["ack"], true);
    EXPECT_EQ(ack["batchID"], batch_id);
    EXPECT_EQ(ack["totalProcessedCount"], 1);
    EXPECT_FALSE(ack["manifestID"].get<std::string>().empty());

    auto again = post("/batch/finish", json{{"contributorToken", "tok-mary"}, {"batchID", batch_id}});
    EXPECT_EQ(again.status_code, 409);

    auto closed = post("/upload/init", json{{"contributorToken", "tok-mary"}, {"filename", "late.jpg"},
                                            {"sizeBytes", 5}, {"batchID", batch_id}});
    EXPECT_EQ(closed.status_code, 409);

    EXPECT_EQ(post("/batch/finish", json{{"contributorToken", "tok-mary"}}).status_code, 400);
    EXPECT_EQ(post("/batch/finish", json{{"contributorToken", "tok-mary"}, {"batchID", "batch_x"}}).status_code, 404);
    EXPECT_EQ(post("/batch/create", json{{"contributorToken", "nope"}}).status_code, 401);
}

TEST_F(IntakeApiTest, HealthAndStats) {
    init(10);

    auto health = get("/health");
    ASSERT_EQ(health.status_code, 200);
    EXPECT_EQ(body_of(health)["status"], "ok");
    EXPECT_EQ(body_of(health)["activeSessions"], 1);

    ASSERT_TRUE(repo.set_state("last_worker_run", "2024-01-01T00:00:00Z").is_ok());
    auto stats = get("/ops/stats");
    ASSERT_EQ(stats.status_code, 200);
    const json j = body_of(stats);
    EXPECT_TRUE(j["backlog"].is_object());
    EXPECT_EQ(j["last_worker_run"], "2024-01-01T00:00:00Z");
    EXPECT_TRUE(j["disk_free_bytes"].is_number());
    EXPECT_EQ(j["active_sessions"], 1);
}
