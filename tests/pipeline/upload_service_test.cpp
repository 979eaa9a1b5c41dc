#include "upl/pipeline/upload_pipeline.hpp"

#include "pipeline/pipeline_test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <thread>

using namespace upl::testing;
using upl::ErrorKind;
using upl::model::SessionStatus;
using upl::pipeline::ChunkUpload;
using upl::pipeline::CreateSessionRequest;
using upl::pipeline::UploadPipeline;
using upl::pipeline::UploadService;

namespace {

class UploadServiceTest : public ::testing::Test {
protected:
    void SetUp() override { start(true); }

    void TearDown() override {
        pipeline_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void start(bool auto_assemble) {
        pipeline_.reset();
        if (root_.empty()) {
            root_ = create_temp_dir("service");
        }
        config_.storage.chunk_root = root_ / "chunks";
        config_.storage.assembly_root = root_ / "assembly";
        config_.storage.asset_root = root_ / "assets";
        config_.storage.repository = "memory";
        config_.scanner.enabled = false;
        config_.retry.max_attempts = 3;
        config_.retry.initial_backoff = std::chrono::milliseconds(1);
        config_.retry.max_backoff = std::chrono::milliseconds(5);
        config_.worker_threads = 2;
        config_.auto_assemble = auto_assemble;

        auto engine = std::make_unique<FakeScanner>();
        engine_ = engine.get();
        auto created = UploadPipeline::create(config_, std::move(engine), clock_.clock());
        ASSERT_TRUE(created.is_ok()) << upl::describe(created.error());
        pipeline_ = std::move(created.value());
    }

    UploadService& service() { return pipeline_->service(); }

    CreateSessionRequest request(const std::string& filename, std::uint64_t total_size, std::uint32_t chunks) {
        CreateSessionRequest r;
        r.workspace_id = "ws_main";
        r.user_id = "user_1";
        r.filename = filename;
        r.total_size = total_size;
        r.chunks_count = chunks;
        return r;
    }

    upl::model::UploadSession create(const std::string& filename, std::uint64_t total_size, std::uint32_t chunks) {
        auto created = service().create_session(request(filename, total_size, chunks));
        EXPECT_TRUE(created.is_ok()) << upl::describe(created.error());
        return created.is_ok() ? created.value() : upl::model::UploadSession{};
    }

    upl::Result<upl::model::Chunk> send(const std::string& session_id,
                                        std::uint32_t number,
                                        const std::vector<std::uint8_t>& data) {
        ChunkUpload upload;
        upload.session_id = session_id;
        upload.chunk_number = number;
        upload.data = data;
        upload.checksum = upl::core::fnv1a_hex(data);
        return service().upload_chunk(upload);
    }

    SessionStatus status_of(const std::string& session_id) {
        auto session = pipeline_->repository().get_session(session_id);
        EXPECT_TRUE(session.is_ok());
        return session.is_ok() ? session.value().status : SessionStatus::Pending;
    }

    fs::path root_;
    ManualClock clock_;
    upl::core::PipelineConfig config_;
    FakeScanner* engine_ = nullptr;
    std::unique_ptr<UploadPipeline> pipeline_;
};

/// Moves the session on to assembling right after the next staged write,
/// as a concurrent complete_upload would.
class AssemblingMidUploadStore : public upl::storage::FileChunkStore {
public:
    AssemblingMidUploadStore(fs::path root, upl::storage::SessionRepository& repository)
        : FileChunkStore(std::move(root)), repository_(repository) {}

    void arm() { armed_ = true; }

    upl::Result<upl::storage::StagedChunk> stage(const std::string& session_id,
                                                 std::uint32_t chunk_number,
                                                 const std::vector<std::uint8_t>& data) override {
        auto staged = FileChunkStore::stage(session_id, chunk_number, data);
        if (armed_.exchange(false)) {
            upl::storage::TransitionRequest request;
            request.expected_from = {SessionStatus::Uploading};
            request.to = SessionStatus::Assembling;
            auto moved = repository_.apply_transition(session_id, request);
            EXPECT_TRUE(moved.is_ok()) << upl::describe(moved.error());
        }
        return staged;
    }

private:
    upl::storage::SessionRepository& repository_;
    std::atomic<bool> armed_{false};
};

std::size_t files_in(const fs::path& dir) {
    std::error_code ec;
    std::size_t count = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        ++count;
    }
    return count;
}

} // namespace

TEST_F(UploadServiceTest, UploadsOutOfOrderAndProducesOneAsset) {
    auto r = request("track.wav", 2044, 2);
    r.metadata = {{"title", "Demo Track"}, {"bpm", 120}};
    auto created = service().create_session(r);
    ASSERT_TRUE(created.is_ok());
    const auto id = created.value().id;
    EXPECT_EQ(id.rfind("ses_", 0), 0u);
    EXPECT_EQ(created.value().status, SessionStatus::Pending);

    const auto first = payload("chunk_1_data", 1022);
    const auto second = payload("chunk_2_data", 1022);
    ASSERT_TRUE(send(id, 2, second).is_ok());
    EXPECT_EQ(status_of(id), SessionStatus::Uploading);
    ASSERT_TRUE(send(id, 1, first).is_ok());

    pipeline_->runner().wait_idle();

    EXPECT_EQ(status_of(id), SessionStatus::Completed);
    auto asset = service().asset_for_session(id);
    ASSERT_TRUE(asset.is_ok()) << upl::describe(asset.error());
    EXPECT_EQ(asset.value().file_size, 2044u);
    EXPECT_EQ(asset.value().content_type, "audio/wav");
    EXPECT_EQ(asset.value().metadata["title"], "Demo Track");
    EXPECT_EQ(asset.value().metadata["bpm"], 120);
    EXPECT_EQ(asset.value().metadata["virus_scan"]["status"], "clean");

    std::string expected(first.begin(), first.end());
    expected.append(second.begin(), second.end());
    EXPECT_EQ(read_file(config_.storage.asset_root / asset.value().storage.key), expected);

    auto view = service().status(id);
    ASSERT_TRUE(view.is_ok());
    EXPECT_EQ(view.value().asset_id, asset.value().id);
    EXPECT_DOUBLE_EQ(view.value().progress, 100.0);
    EXPECT_EQ(view.value().completed_chunks, 2u);
    EXPECT_EQ(view.value().remaining_bytes, 0u);

    const auto& stats = pipeline_->metrics().get_stats();
    EXPECT_EQ(stats.sessions_created.load(), 1u);
    EXPECT_EQ(stats.chunks_stored.load(), 2u);
    EXPECT_EQ(stats.assets_finalized.load(), 1u);
    EXPECT_EQ(engine_->calls(), 1);
}

TEST_F(UploadServiceTest, InfectedUploadNeverBecomesAnAsset) {
    engine_->push_infected("Eicar-Test-Signature");
    const auto session = create("payload.zip", 64, 1);
    ASSERT_TRUE(send(session.id, 1, payload("X5O!P%@AP", 64)).is_ok());
    pipeline_->runner().wait_idle();

    EXPECT_EQ(status_of(session.id), SessionStatus::VirusScanFailed);
    auto asset = service().asset_for_session(session.id);
    ASSERT_TRUE(asset.is_error());
    EXPECT_EQ(asset.error().kind, ErrorKind::NotFound);

    auto stored = pipeline_->repository().get_session(session.id);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_FALSE(fs::exists(stored.value().assembled_file_path));
}

TEST_F(UploadServiceTest, UnavailableScannerStillFinalizes) {
    engine_->push_error(ErrorKind::ScannerUnavailable, "connection refused");
    const auto session = create("notes.txt", 10, 1);
    ASSERT_TRUE(send(session.id, 1, payload("hello", 10)).is_ok());
    pipeline_->runner().wait_idle();

    EXPECT_EQ(status_of(session.id), SessionStatus::Completed);
    auto asset = service().asset_for_session(session.id);
    ASSERT_TRUE(asset.is_ok());
    EXPECT_EQ(asset.value().metadata["virus_scan"]["status"], "skipped");
}

TEST_F(UploadServiceTest, TransientScanFailureIsRetried) {
    engine_->push_error(ErrorKind::ScanTimeout, "no answer");
    const auto session = create("retry.mp3", 10, 1);
    ASSERT_TRUE(send(session.id, 1, payload("ID3", 10)).is_ok());
    pipeline_->runner().wait_idle();

    EXPECT_EQ(engine_->calls(), 2);
    EXPECT_EQ(status_of(session.id), SessionStatus::Completed);
    EXPECT_TRUE(service().asset_for_session(session.id).is_ok());
}

TEST_F(UploadServiceTest, ExhaustedScanRetriesFailTheSession) {
    for (int i = 0; i < 3; ++i) {
        engine_->push_error(ErrorKind::ScanTimeout, "no answer");
    }
    const auto session = create("slow.mp3", 10, 1);
    ASSERT_TRUE(send(session.id, 1, payload("ID3", 10)).is_ok());
    pipeline_->runner().wait_idle();

    EXPECT_EQ(engine_->calls(), 3);
    auto stored = pipeline_->repository().get_session(session.id);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().status, SessionStatus::VirusScanFailed);
    EXPECT_EQ(stored.value().error_message, "Virus scan failed: no answer");
}

TEST_F(UploadServiceTest, ConcurrentChunksTriggerOneAssembly) {
    const std::uint32_t count = 8;
    const auto session = create("burst.bin", count * 128, count);

    std::vector<std::thread> threads;
    for (std::uint32_t n = 1; n <= count; ++n) {
        threads.emplace_back([this, &session, n] {
            EXPECT_TRUE(send(session.id, n, payload("part" + std::to_string(n), 128)).is_ok());
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    pipeline_->runner().wait_idle();

    EXPECT_EQ(status_of(session.id), SessionStatus::Completed);
    EXPECT_EQ(pipeline_->metrics().get_stats().assemblies_completed.load(), 1u);
    auto assets = pipeline_->repository().list_assets("ws_main");
    ASSERT_TRUE(assets.is_ok());
    EXPECT_EQ(assets.value().size(), 1u);
}

TEST_F(UploadServiceTest, RejectsInvalidSessionRequests) {
    auto expect_invalid = [this](CreateSessionRequest r) {
        auto created = service().create_session(r);
        ASSERT_TRUE(created.is_error()) << r.filename;
        EXPECT_EQ(created.error().kind, ErrorKind::InvalidArgument) << r.filename;
    };

    auto r = request("ok.wav", 100, 1);
    r.workspace_id.clear();
    expect_invalid(r);

    r = request("ok.wav", 100, 1);
    r.user_id.clear();
    expect_invalid(r);

    for (const std::string name : {"", "   ", "...", "a..b.wav", "dir/file.wav", "dir\\file.wav",
                                   "what?.wav", "pipe|.wav", "CON", "con.txt", "LPT1.wav", "com9"}) {
        expect_invalid(request(name, 100, 1));
    }
    expect_invalid(request(std::string(256, 'a'), 100, 1));

    expect_invalid(request("zero.wav", 0, 1));
    expect_invalid(request("huge.wav", config_.limits.max_file_size + 1, 1));
    expect_invalid(request("nochunks.wav", 100, 0));
    expect_invalid(request("tiny.wav", 3, 4));

    r = request("meta.wav", 100, 1);
    r.metadata = nlohmann::json::array({1, 2});
    expect_invalid(r);

    EXPECT_TRUE(UploadService::validate_filename("com0.txt", 255).is_ok());
    EXPECT_TRUE(UploadService::validate_filename("Console Mix.wav", 255).is_ok());
    EXPECT_TRUE(UploadService::validate_filename(std::string(255, 'a'), 255).is_ok());
}

TEST_F(UploadServiceTest, ScreensRiskyFilenames) {
    for (const std::string name : {"screensaver.scr", "shortcut.PIF", "setup.com", "invoice.pdf.com"}) {
        auto created = service().create_session(request(name, 100, 1));
        ASSERT_TRUE(created.is_error()) << name;
        EXPECT_EQ(created.error().kind, ErrorKind::InvalidArgument) << name;
        EXPECT_NE(created.error().message.find("not allowed"), std::string::npos) << name;
    }
    EXPECT_TRUE(UploadService::validate_filename("scr.wav", 255).is_ok());
    EXPECT_TRUE(UploadService::validate_filename("example.com.wav", 255).is_ok());

    EXPECT_TRUE(UploadService::has_multiple_extensions("invoice.pdf.exe"));
    EXPECT_TRUE(UploadService::has_multiple_extensions("Backing.WAV.zip"));
    EXPECT_FALSE(UploadService::has_multiple_extensions("mix.final.wav"));
    EXPECT_FALSE(UploadService::has_multiple_extensions("song.wav"));
    EXPECT_FALSE(UploadService::has_multiple_extensions(".pdf"));

    // Flagged names are accepted with a warning on record.
    const auto flagged = create("invoice.pdf.exe", 100, 1);
    auto view = service().status(flagged.id);
    ASSERT_TRUE(view.is_ok());
    EXPECT_EQ(view.value().metadata["screening"]["risk_level"], "high");
    EXPECT_EQ(view.value().metadata["screening"]["warnings"][0], "Multiple file extensions detected");

    const auto plain = create("plain.wav", 100, 1);
    EXPECT_FALSE(service().status(plain.id).value().metadata.contains("screening"));
}

TEST_F(UploadServiceTest, FilenameSlotIsExclusiveUntilReleased) {
    const auto first = create("dup.wav", 100, 1);

    auto duplicate = service().create_session(request("dup.wav", 100, 1));
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().kind, ErrorKind::Conflict);

    auto other_container = request("dup.wav", 100, 1);
    other_container.container_id = "folder_1";
    EXPECT_TRUE(service().create_session(other_container).is_ok());

    ASSERT_TRUE(service().cancel(first.id, "changed my mind").is_ok());
    EXPECT_TRUE(service().create_session(request("dup.wav", 100, 1)).is_ok());
}

TEST_F(UploadServiceTest, RejectsBadChunks) {
    const auto session = create("chunks.wav", 30, 3);

    auto zero = send(session.id, 0, payload("a", 10));
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error().kind, ErrorKind::InvalidArgument);

    auto beyond = send(session.id, 4, payload("a", 10));
    ASSERT_TRUE(beyond.is_error());
    EXPECT_EQ(beyond.error().kind, ErrorKind::InvalidArgument);

    auto empty = send(session.id, 1, {});
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().kind, ErrorKind::InvalidArgument);

    ChunkUpload corrupted;
    corrupted.session_id = session.id;
    corrupted.chunk_number = 1;
    corrupted.data = payload("a", 10);
    corrupted.checksum = "0000000000000000";
    auto mismatch = service().upload_chunk(corrupted);
    ASSERT_TRUE(mismatch.is_error());
    EXPECT_EQ(mismatch.error().kind, ErrorKind::InvalidArgument);
    EXPECT_FALSE(pipeline_->chunks().exists(upl::storage::FileChunkStore::make_key(session.id, 1)));

    ChunkUpload uppercase = corrupted;
    auto hex = upl::core::fnv1a_hex(uppercase.data);
    std::transform(hex.begin(), hex.end(), hex.begin(), [](unsigned char c) { return std::toupper(c); });
    uppercase.checksum = hex;
    EXPECT_TRUE(service().upload_chunk(uppercase).is_ok());

    auto unknown = send("ses_missing", 1, payload("a", 10));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().kind, ErrorKind::NotFound);
}

TEST_F(UploadServiceTest, StatusReportsProgress) {
    const auto session = create("progress.wav", 300, 3);
    ASSERT_TRUE(send(session.id, 2, payload("b", 100)).is_ok());

    auto view = service().status(session.id);
    ASSERT_TRUE(view.is_ok());
    EXPECT_EQ(view.value().session.status, SessionStatus::Uploading);
    EXPECT_EQ(view.value().completed_chunks, 1u);
    EXPECT_EQ(view.value().missing_chunks, (std::vector<std::uint32_t>{1, 3}));
    EXPECT_DOUBLE_EQ(view.value().progress, 33.33);
    EXPECT_EQ(view.value().uploaded_bytes, 100u);
    EXPECT_EQ(view.value().remaining_bytes, 200u);
    EXPECT_EQ(view.value().recommended_chunk_size, 1024u * 1024u);
    EXPECT_FALSE(view.value().asset_id.has_value());

    const auto json = upl::pipeline::to_json(view.value());
    EXPECT_EQ(json["status"], "uploading");
    EXPECT_EQ(json["missing_chunks"].size(), 2u);
    EXPECT_FALSE(json.contains("asset_id"));
}

TEST_F(UploadServiceTest, ReuploadReplacesTheChunk) {
    start(false);
    const auto session = create("redo.wav", 30, 2);
    ASSERT_TRUE(send(session.id, 1, payload("first", 10)).is_ok());
    ASSERT_TRUE(send(session.id, 1, payload("second", 20)).is_ok());

    auto chunks = pipeline_->repository().list_chunks(session.id);
    ASSERT_TRUE(chunks.is_ok());
    ASSERT_EQ(chunks.value().size(), 1u);
    EXPECT_EQ(chunks.value()[0].size, 20u);

    auto view = service().status(session.id);
    ASSERT_TRUE(view.is_ok());
    EXPECT_EQ(view.value().uploaded_bytes, 20u);
}

TEST_F(UploadServiceTest, CompleteUploadRequiresEveryChunk) {
    start(false);
    const auto session = create("manual.wav", 20, 2);
    ASSERT_TRUE(send(session.id, 1, payload("one", 10)).is_ok());

    auto early = service().complete_upload(session.id);
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(status_of(session.id), SessionStatus::Uploading);

    ASSERT_TRUE(send(session.id, 2, payload("two", 10)).is_ok());
    EXPECT_EQ(status_of(session.id), SessionStatus::Uploading);

    auto completed = service().complete_upload(session.id);
    ASSERT_TRUE(completed.is_ok()) << upl::describe(completed.error());
    pipeline_->runner().wait_idle();
    EXPECT_EQ(status_of(session.id), SessionStatus::Completed);

    auto again = service().complete_upload(session.id);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().status, SessionStatus::Completed);

    auto assets = pipeline_->repository().list_assets("ws_main");
    ASSERT_TRUE(assets.is_ok());
    EXPECT_EQ(assets.value().size(), 1u);
}

TEST_F(UploadServiceTest, CancelDiscardsChunksAndIsIdempotent) {
    const auto session = create("abort.wav", 20, 2);
    ASSERT_TRUE(send(session.id, 1, payload("one", 10)).is_ok());

    auto cancelled = service().cancel(session.id, "user abort");
    ASSERT_TRUE(cancelled.is_ok());
    EXPECT_EQ(cancelled.value().status, SessionStatus::Cancelled);
    EXPECT_EQ(cancelled.value().error_message, "user abort");
    EXPECT_FALSE(pipeline_->chunks().exists(upl::storage::FileChunkStore::make_key(session.id, 1)));

    auto chunks = pipeline_->repository().list_chunks(session.id);
    ASSERT_TRUE(chunks.is_ok());
    EXPECT_TRUE(chunks.value().empty());

    auto late = send(session.id, 2, payload("two", 10));
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error().kind, ErrorKind::InvalidTransition);

    auto again = service().cancel(session.id, "again");
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().error_message, "user abort");

    auto view = service().status(session.id);
    ASSERT_TRUE(view.is_ok());
    EXPECT_EQ(view.value().metadata["cancellation"]["status_before"], "uploading");
    EXPECT_EQ(pipeline_->metrics().get_stats().sessions_cancelled.load(), 1u);
}

TEST_F(UploadServiceTest, FinishedSessionsCannotBeCancelled) {
    const auto session = create("done.wav", 10, 1);
    ASSERT_TRUE(send(session.id, 1, payload("x", 10)).is_ok());
    pipeline_->runner().wait_idle();
    ASSERT_EQ(status_of(session.id), SessionStatus::Completed);

    auto cancelled = service().cancel(session.id, "too late");
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error().kind, ErrorKind::InvalidTransition);
    EXPECT_TRUE(service().asset_for_session(session.id).is_ok());
}

TEST_F(UploadServiceTest, ListsNewestSessionsFirst) {
    start(false);
    const auto a = create("a.wav", 10, 1);
    clock_.advance(std::chrono::seconds(1));
    const auto b = create("b.wav", 10, 1);
    clock_.advance(std::chrono::seconds(1));
    const auto c = create("c.wav", 10, 1);
    ASSERT_TRUE(send(c.id, 1, payload("c", 10)).is_ok());

    auto elsewhere = request("a.wav", 10, 1);
    elsewhere.workspace_id = "ws_other";
    ASSERT_TRUE(service().create_session(elsewhere).is_ok());

    auto all = service().list_sessions("ws_main");
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[0].id, c.id);
    EXPECT_EQ(all.value()[1].id, b.id);
    EXPECT_EQ(all.value()[2].id, a.id);

    auto pending = service().list_sessions("ws_main", SessionStatus::Pending);
    ASSERT_TRUE(pending.is_ok());
    EXPECT_EQ(pending.value().size(), 2u);

    auto limited = service().list_sessions("ws_main", std::nullopt, 1);
    ASSERT_TRUE(limited.is_ok());
    ASSERT_EQ(limited.value().size(), 1u);
    EXPECT_EQ(limited.value()[0].id, c.id);
}

TEST(UploadServiceStaticTest, RecommendedChunkSize) {
    constexpr std::uint64_t MiB = 1024ULL * 1024;
    constexpr std::uint64_t GiB = 1024ULL * MiB;
    EXPECT_EQ(UploadService::recommended_chunk_size(1), MiB);
    EXPECT_EQ(UploadService::recommended_chunk_size(10 * MiB), MiB);
    EXPECT_EQ(UploadService::recommended_chunk_size(10 * MiB + 1), 5 * MiB);
    EXPECT_EQ(UploadService::recommended_chunk_size(GiB - 1), 5 * MiB);
    EXPECT_EQ(UploadService::recommended_chunk_size(GiB), 10 * MiB);
    EXPECT_EQ(UploadService::recommended_chunk_size(5 * GiB), 10 * MiB);
    EXPECT_EQ(UploadService::recommended_chunk_size(5 * GiB + 1), 25 * MiB);
}

TEST(ChunkUploadRaceTest, LateRetryKeepsTheAcceptedChunk) {
    StageHarness h("late_retry");
    AssemblingMidUploadStore chunks(h.root / "racing_chunks", h.repository);
    FakeScanner engine;
    upl::pipeline::Assembler assembler(h.repository, chunks, h.assembly_root(), h.bus, h.clock.clock());
    upl::pipeline::ScannerGateway gateway(h.repository, engine, h.bus, h.clock.clock());
    upl::pipeline::Finalizer finalizer(h.repository, h.durable, h.bus, h.clock.clock());
    upl::core::PipelineConfig config;
    config.auto_assemble = false;
    upl::pipeline::JobRunner runner(1, config.retry);
    UploadService service(config, h.repository, chunks, assembler, gateway, finalizer, runner, h.bus,
                          h.clock.clock());

    CreateSessionRequest request;
    request.workspace_id = "ws_main";
    request.user_id = "user_1";
    request.filename = "take.wav";
    request.total_size = 20;
    request.chunks_count = 2;
    auto created = service.create_session(request);
    ASSERT_TRUE(created.is_ok()) << upl::describe(created.error());
    const auto id = created.value().id;

    const auto first = payload("first-", 10);
    const auto second = payload("second-", 10);
    ASSERT_TRUE(service.upload_chunk(ChunkUpload{id, 1, first, std::nullopt}).is_ok());
    ASSERT_TRUE(service.upload_chunk(ChunkUpload{id, 2, second, std::nullopt}).is_ok());

    chunks.arm();
    auto late = service.upload_chunk(ChunkUpload{id, 2, payload("retry-", 10), std::nullopt});
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error().kind, ErrorKind::InvalidTransition);

    const auto chunk_path = chunks.root() / upl::storage::FileChunkStore::make_key(id, 2);
    EXPECT_EQ(read_file(chunk_path), std::string(second.begin(), second.end()));
    EXPECT_EQ(files_in(chunk_path.parent_path()), 2u);

    auto assembled = assembler.assemble(id);
    ASSERT_TRUE(assembled.is_ok()) << upl::describe(assembled.error());
    EXPECT_EQ(read_file(assembled.value().path),
              std::string(first.begin(), first.end()) + std::string(second.begin(), second.end()));
    EXPECT_EQ(h.repository.get_session(id).value().status, SessionStatus::VirusScanning);
}
