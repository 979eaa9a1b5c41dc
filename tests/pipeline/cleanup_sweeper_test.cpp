#include "upl/pipeline/cleanup_sweeper.hpp"

#include "pipeline/pipeline_test_support.hpp"
#include "upl/events/events.hpp"

#include <gtest/gtest.h>

using namespace upl::testing;
using upl::ErrorKind;
using upl::model::SessionStatus;
using upl::pipeline::CleanupSweeper;

namespace {

upl::core::CleanupConfig test_config() {
    upl::core::CleanupConfig config;
    config.stuck_assembly_after = std::chrono::seconds(3600);
    config.pending_expiry_after = std::chrono::seconds(3600);
    config.failed_retention = std::chrono::seconds(24 * 3600);
    config.cancelled_retention = std::chrono::seconds(2 * 3600);
    config.interval = std::chrono::seconds(60);
    config.batch_size = 50;
    return config;
}

void move_to(StageHarness& h, const std::string& id, SessionStatus from, SessionStatus to) {
    upl::storage::TransitionRequest request;
    request.expected_from = {from};
    request.to = to;
    request.at = h.clock.now();
    auto moved = h.repository.apply_transition(id, request);
    ASSERT_TRUE(moved.is_ok()) << upl::describe(moved.error());
}

upl::model::UploadSession same_file(const std::string& id, const std::string& filename) {
    upl::model::UploadSession s;
    s.id = id;
    s.workspace_id = "ws_test";
    s.user_id = "user_test";
    s.filename = filename;
    s.total_size = 100;
    s.chunks_count = 1;
    return s;
}

bool session_exists(StageHarness& h, const std::string& id) {
    return h.repository.get_session(id).is_ok();
}

/// Chunk store whose remove_session fails for one session.
class FailingChunkStore : public upl::storage::FileChunkStore {
public:
    FailingChunkStore(fs::path root, std::string broken_session)
        : FileChunkStore(std::move(root)), broken_session_(std::move(broken_session)) {}

    upl::Result<std::size_t> remove_session(const std::string& session_id) override {
        if (session_id == broken_session_) {
            return upl::Err<std::size_t>(ErrorKind::Storage, "permission denied");
        }
        return FileChunkStore::remove_session(session_id);
    }

private:
    std::string broken_session_;
};

} // namespace

TEST(CleanupSweeperTest, StuckAssemblyIsFailedAndFreesTheFilename) {
    StageHarness h("sweeper_stuck");
    CleanupSweeper sweeper(h.repository, h.chunks, test_config(), h.bus, h.clock.clock());

    h.seed("ses_stuck", "song.mp3", 100, 1, SessionStatus::Assembling);
    h.clock.advance(std::chrono::hours(2));

    // Same filename is held while the stuck session is assembling.
    auto blocked = h.repository.create_session(same_file("ses_retry", "song.mp3"), {});
    ASSERT_TRUE(blocked.is_error());
    EXPECT_EQ(blocked.error().kind, ErrorKind::Conflict);

    const auto report = sweeper.sweep_stuck(h.clock.now());
    EXPECT_EQ(report.stuck_failed, 1u);
    EXPECT_EQ(report.errors, 0u);

    auto session = h.repository.get_session("ses_stuck");
    ASSERT_TRUE(session.is_ok());
    EXPECT_EQ(session.value().status, SessionStatus::Failed);
    EXPECT_EQ(session.value().error_message, "Assembly timed out after 7200s");

    auto history = h.repository.events("ses_stuck");
    ASSERT_TRUE(history.is_ok());
    const auto view = upl::session::fold_metadata(history.value());
    EXPECT_EQ(view["cleanup"]["status_before"], "assembling");

    EXPECT_TRUE(h.repository.create_session(same_file("ses_retry", "song.mp3"), {}).is_ok());
}

TEST(CleanupSweeperTest, StuckScanIsFailedAsVirusScanFailed) {
    StageHarness h("sweeper_stuck_scan");
    CleanupSweeper sweeper(h.repository, h.chunks, test_config(), h.bus, h.clock.clock());

    std::vector<SessionStatus> failures;
    h.bus.subscribe<upl::events::SessionFailedEvent>([&](const upl::events::SessionFailedEvent& e) {
        failures.push_back(e.status);
    });

    h.seed("ses_scan", "clip.mov", 100, 1, SessionStatus::Assembling);
    move_to(h, "ses_scan", SessionStatus::Assembling, SessionStatus::VirusScanning);
    h.clock.advance(std::chrono::minutes(61));

    const auto report = sweeper.sweep_stuck(h.clock.now());
    EXPECT_EQ(report.stuck_failed, 1u);
    auto session = h.repository.get_session("ses_scan");
    ASSERT_TRUE(session.is_ok());
    EXPECT_EQ(session.value().status, SessionStatus::VirusScanFailed);
    EXPECT_EQ(failures, (std::vector<SessionStatus>{SessionStatus::VirusScanFailed}));
}

TEST(CleanupSweeperTest, RecentWorkIsLeftAlone) {
    StageHarness h("sweeper_recent");
    CleanupSweeper sweeper(h.repository, h.chunks, test_config(), h.bus, h.clock.clock());

    h.seed("ses_pending", "a.wav", 10, 1);
    h.seed("ses_assembling", "b.wav", 10, 1, SessionStatus::Assembling);
    h.clock.advance(std::chrono::minutes(30));

    const auto report = sweeper.run_once();
    EXPECT_EQ(report.stuck_failed, 0u);
    EXPECT_EQ(report.expired_removed, 0u);
    EXPECT_TRUE(session_exists(h, "ses_pending"));
    auto assembling = h.repository.get_session("ses_assembling");
    ASSERT_TRUE(assembling.is_ok());
    EXPECT_EQ(assembling.value().status, SessionStatus::Assembling);
}

TEST(CleanupSweeperTest, ExpiryFollowsEachStatusRetention) {
    StageHarness h("sweeper_expiry");
    CleanupSweeper sweeper(h.repository, h.chunks, test_config(), h.bus, h.clock.clock());

    h.seed("ses_abandoned", "abandoned.wav", 20, 2, SessionStatus::Uploading);
    h.put_chunk("ses_abandoned", 1, payload("left behind", 10));

    h.seed("ses_cancelled", "cancelled.wav", 10, 1);
    move_to(h, "ses_cancelled", SessionStatus::Pending, SessionStatus::Cancelled);

    h.seed("ses_failed", "failed.wav", 10, 1, SessionStatus::Assembling);
    move_to(h, "ses_failed", SessionStatus::Assembling, SessionStatus::Failed);

    h.seed("ses_done", "done.wav", 10, 1, SessionStatus::Assembling);
    move_to(h, "ses_done", SessionStatus::Assembling, SessionStatus::VirusScanning);
    move_to(h, "ses_done", SessionStatus::VirusScanning, SessionStatus::Completed);

    // Three hours: pending expiry and cancelled retention passed, failed retention not.
    h.clock.advance(std::chrono::hours(3));
    auto report = sweeper.sweep_expired(h.clock.now());
    EXPECT_EQ(report.expired_removed, 2u);
    EXPECT_EQ(report.errors, 0u);
    EXPECT_FALSE(session_exists(h, "ses_abandoned"));
    EXPECT_FALSE(session_exists(h, "ses_cancelled"));
    EXPECT_TRUE(session_exists(h, "ses_failed"));
    EXPECT_FALSE(fs::exists(h.chunks.root() / "session_ses_abandoned"));

    h.clock.advance(std::chrono::hours(24));
    report = sweeper.sweep_expired(h.clock.now());
    EXPECT_EQ(report.expired_removed, 1u);
    EXPECT_FALSE(session_exists(h, "ses_failed"));

    // Completed sessions are history.
    EXPECT_TRUE(session_exists(h, "ses_done"));
}

TEST(CleanupSweeperTest, DestroyRemovesAssembledFile) {
    StageHarness h("sweeper_destroy");
    CleanupSweeper sweeper(h.repository, h.chunks, test_config(), h.bus, h.clock.clock());

    h.seed("ses_x", "x.bin", 4, 1, SessionStatus::Assembling);
    fs::create_directories(h.assembly_root());
    const auto assembled = h.assembly_root() / "assembled_ses_x.bin";
    std::ofstream(assembled, std::ios::binary) << "data";

    upl::storage::TransitionRequest request;
    request.expected_from = {SessionStatus::Assembling};
    request.to = SessionStatus::VirusScanning;
    request.assembled_file_path = assembled.string();
    auto scanning = h.repository.apply_transition("ses_x", request);
    ASSERT_TRUE(scanning.is_ok());

    ASSERT_TRUE(sweeper.destroy_session(scanning.value()).is_ok());
    EXPECT_FALSE(fs::exists(assembled));
    EXPECT_FALSE(session_exists(h, "ses_x"));
}

TEST(CleanupSweeperTest, OneBrokenSessionDoesNotStopTheSweep) {
    StageHarness h("sweeper_isolation");
    FailingChunkStore chunks(h.root / "chunks", "ses_b");
    CleanupSweeper sweeper(h.repository, chunks, test_config(), h.bus, h.clock.clock());

    h.seed("ses_a", "a.wav", 10, 1);
    h.seed("ses_b", "b.wav", 10, 1);
    h.seed("ses_c", "c.wav", 10, 1);
    h.clock.advance(std::chrono::hours(2));

    const auto report = sweeper.run_once();
    EXPECT_EQ(report.expired_removed, 2u);
    EXPECT_EQ(report.errors, 1u);
    EXPECT_FALSE(session_exists(h, "ses_a"));
    EXPECT_TRUE(session_exists(h, "ses_b"));
    EXPECT_FALSE(session_exists(h, "ses_c"));
}

TEST(CleanupSweeperTest, SweepsBeyondOneBatch) {
    StageHarness h("sweeper_batches");
    auto config = test_config();
    config.batch_size = 3;
    CleanupSweeper sweeper(h.repository, h.chunks, config, h.bus, h.clock.clock());

    for (int i = 0; i < 10; ++i) {
        h.seed("ses_" + std::to_string(10 + i), "file_" + std::to_string(i) + ".wav", 10, 1,
               SessionStatus::Assembling);
    }
    h.clock.advance(std::chrono::hours(2));

    const auto report = sweeper.sweep_stuck(h.clock.now());
    EXPECT_EQ(report.stuck_failed, 10u);

    upl::storage::SessionQuery query;
    query.statuses = {SessionStatus::Failed};
    query.limit = 100;
    auto failed = h.repository.find_sessions(query);
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(failed.value().size(), 10u);
}

TEST(CleanupSweeperTest, RunOnceAnnouncesItsReport) {
    StageHarness h("sweeper_event");
    CleanupSweeper sweeper(h.repository, h.chunks, test_config(), h.bus, h.clock.clock());

    std::vector<upl::events::SweepCompletedEvent> reports;
    h.bus.subscribe<upl::events::SweepCompletedEvent>([&](const upl::events::SweepCompletedEvent& e) {
        reports.push_back(e);
    });

    h.seed("ses_old", "old.wav", 10, 1);
    h.seed("ses_hung", "hung.wav", 10, 1, SessionStatus::Assembling);
    h.clock.advance(std::chrono::hours(2));

    sweeper.run_once();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].expired_removed, 1u);
    EXPECT_EQ(reports[0].stuck_failed, 1u);
    EXPECT_EQ(reports[0].errors, 0u);
}

TEST(CleanupSweeperTest, TimerRunsSweepOnTheIoContext) {
    StageHarness h("sweeper_timer");
    auto config = test_config();
    config.interval = std::chrono::seconds(1);
    CleanupSweeper sweeper(h.repository, h.chunks, config, h.bus, h.clock.clock());

    boost::asio::io_context io;
    int runs = 0;
    h.bus.subscribe<upl::events::SweepCompletedEvent>([&](const upl::events::SweepCompletedEvent&) {
        if (++runs == 2) {
            sweeper.stop();
        }
    });

    sweeper.start(io);
    io.run();
    EXPECT_EQ(runs, 2);
}

TEST(CleanupSweeperTest, SlowButSteadyUploadIsNotExpired) {
    StageHarness h("sweeper_steady");
    CleanupSweeper sweeper(h.repository, h.chunks, test_config(), h.bus, h.clock.clock());

    h.seed("ses_slow", "slow.wav", 40, 4, SessionStatus::Uploading);
    for (std::uint32_t n = 1; n <= 4; ++n) {
        h.clock.advance(std::chrono::minutes(25));
        h.put_chunk("ses_slow", n, payload("part" + std::to_string(n), 10));
        const auto report = sweeper.run_once();
        EXPECT_EQ(report.expired_removed, 0u) << "after chunk " << n;
        ASSERT_TRUE(session_exists(h, "ses_slow")) << "after chunk " << n;
    }
    EXPECT_EQ(h.repository.list_chunks("ses_slow").value().size(), 4u);
    EXPECT_TRUE(h.chunks.exists(upl::storage::FileChunkStore::make_key("ses_slow", 1)));

    // Once the chunks stop coming the session goes stale as usual.
    h.clock.advance(std::chrono::minutes(61));
    EXPECT_EQ(sweeper.run_once().expired_removed, 1u);
    EXPECT_FALSE(session_exists(h, "ses_slow"));
}

TEST(CleanupSweeperTest, CompletedSessionThatNeverFinalizedIsFailed) {
    StageHarness h("sweeper_unfinalized");
    CleanupSweeper sweeper(h.repository, h.chunks, test_config(), h.bus, h.clock.clock());

    h.seed("ses_lost", "lost.wav", 4, 1, SessionStatus::Assembling);
    fs::create_directories(h.assembly_root());
    const auto assembled = h.assembly_root() / "ses_lost_lost.wav";
    std::ofstream(assembled, std::ios::binary) << "data";
    upl::storage::TransitionRequest request;
    request.expected_from = {SessionStatus::Assembling};
    request.to = SessionStatus::VirusScanning;
    request.assembled_file_path = assembled.string();
    ASSERT_TRUE(h.repository.apply_transition("ses_lost", request).is_ok());
    move_to(h, "ses_lost", SessionStatus::VirusScanning, SessionStatus::Completed);

    h.seed("ses_kept", "kept.wav", 4, 1, SessionStatus::Assembling);
    move_to(h, "ses_kept", SessionStatus::Assembling, SessionStatus::VirusScanning);
    move_to(h, "ses_kept", SessionStatus::VirusScanning, SessionStatus::Completed);
    ASSERT_TRUE(h.repository.append_event("ses_kept",
        upl::session::make_event("finalized", upl::session::keys::kFinalization, {{"asset_id", "ast_kept"}},
                                 h.clock.now()),
        {SessionStatus::Completed}).is_ok());

    // Within the threshold a finalize job may still be on its way.
    h.clock.advance(std::chrono::minutes(30));
    EXPECT_EQ(sweeper.run_once().stuck_failed, 0u);

    h.clock.advance(std::chrono::minutes(90));
    auto report = sweeper.run_once();
    EXPECT_EQ(report.stuck_failed, 1u);
    EXPECT_EQ(report.errors, 0u);

    auto lost = h.repository.get_session("ses_lost");
    ASSERT_TRUE(lost.is_ok());
    EXPECT_EQ(lost.value().status, SessionStatus::FinalizationFailed);
    EXPECT_EQ(lost.value().error_message, "Finalization did not run within 7200s");
    EXPECT_FALSE(fs::exists(assembled));

    EXPECT_EQ(h.repository.get_session("ses_kept").value().status, SessionStatus::Completed);
    EXPECT_EQ(sweeper.run_once().stuck_failed, 0u);
}
