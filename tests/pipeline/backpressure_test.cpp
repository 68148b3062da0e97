#include "vault/pipeline/backpressure.hpp"

#include "vault/events/events.hpp"

#include <gtest/gtest.h>

using namespace vault::pipeline;

namespace {

class FakeBacklog : public BacklogSource {
public:
    std::size_t size = 0;
    bool fail = false;

    vault::Result<std::size_t> processing_backlog() const override {
        if (fail) {
            return vault::fail<std::size_t>(vault::ErrorCode::Storage, "locked");
        }
        return vault::Ok(size);
    }
};

DiskProbe fixed_free(std::uint64_t bytes) {
    return [bytes](const std::filesystem::path&) -> vault::Result<std::uint64_t> {
        return vault::Ok(bytes);
    };
}

vault::config::BackpressureConfig limits() {
    vault::config::BackpressureConfig config;
    config.min_free_disk_bytes = 1000;
    config.max_backlog = 10;
    return config;
}

} // namespace

TEST(BackpressureTest, AllowsWhenHealthy) {
    FakeBacklog backlog;
    backlog.size = 10;
    BackpressureGovernor governor(limits(), "/cache", backlog, nullptr, fixed_free(1000));

    EXPECT_TRUE(governor.allow_intake());
    const auto decision = governor.evaluate();
    EXPECT_EQ(decision.free_bytes, 1000u);
    EXPECT_EQ(decision.backlog, 10u);
}

TEST(BackpressureTest, PausesOnLowDisk) {
    vault::events::EventBus bus;
    int paused = 0;
    bus.subscribe<vault::events::IntakePausedEvent>([&paused](const vault::events::IntakePausedEvent& e) {
        ++paused;
        EXPECT_EQ(e.free_bytes, 999u);
    });

    FakeBacklog backlog;
    BackpressureGovernor governor(limits(), "/cache", backlog, &bus, fixed_free(999));

    EXPECT_FALSE(governor.allow_intake());
    EXPECT_EQ(paused, 1);
    EXPECT_NE(governor.evaluate().reason.find("free disk"), std::string::npos);
}

TEST(BackpressureTest, PausesOnBacklog) {
    FakeBacklog backlog;
    backlog.size = 11;
    BackpressureGovernor governor(limits(), "/cache", backlog, nullptr, fixed_free(5000));

    EXPECT_FALSE(governor.allow_intake());
    EXPECT_NE(governor.evaluate().reason.find("backlog"), std::string::npos);
}

TEST(BackpressureTest, ProbeFailuresPause) {
    FakeBacklog backlog;
    DiskProbe broken = [](const std::filesystem::path&) -> vault::Result<std::uint64_t> {
        return vault::fail<std::uint64_t>(vault::ErrorCode::Io, "statvfs failed");
    };
    BackpressureGovernor disk_down(limits(), "/cache", backlog, nullptr, broken);
    EXPECT_FALSE(disk_down.allow_intake());

    backlog.fail = true;
    BackpressureGovernor db_down(limits(), "/cache", backlog, nullptr, fixed_free(5000));
    EXPECT_FALSE(db_down.allow_intake());
}

TEST(BackpressureTest, FilesystemProbeWalksToExistingAncestor) {
    auto free_bytes = filesystem_free_bytes(std::filesystem::temp_directory_path() / "vault-missing" / "cache");
    ASSERT_TRUE(free_bytes.is_ok());
    EXPECT_GT(free_bytes.value(), 0u);
}
