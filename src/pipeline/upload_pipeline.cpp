#include "upl/pipeline/upload_pipeline.hpp"

#include "upl/scanner/clamd_scanner.hpp"
#include "upl/storage/memory_repository.hpp"
#include "upl/storage/sqlite_repository.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace upl::pipeline {
namespace fs = std::filesystem;

upl::Result<std::unique_ptr<UploadPipeline>> UploadPipeline::create(const core::PipelineConfig& config,
                                                                    std::unique_ptr<scanner::Scanner> engine,
                                                                    core::Clock clock) {
    std::unique_ptr<storage::SessionRepository> repository;
    if (config.storage.repository == "sqlite") {
        std::error_code ec;
        const auto parent = config.storage.database_path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
        }
        auto opened = storage::SqliteRepository::open(config.storage.database_path);
        if (opened.is_error()) {
            return upl::Err<std::unique_ptr<UploadPipeline>>(opened.error());
        }
        repository = std::move(opened.value());
    } else {
        repository = std::make_unique<storage::MemoryRepository>();
    }

    if (!engine) {
        if (config.scanner.enabled) {
            engine = std::make_unique<scanner::ClamdScanner>(config.scanner);
        } else {
            engine = std::make_unique<scanner::NullScanner>();
        }
    }

    spdlog::info("[UploadPipeline] repository={} scanner={} workers={}",
                 config.storage.repository, engine->name(), config.worker_threads);

    return upl::Ok(std::unique_ptr<UploadPipeline>(
        new UploadPipeline(config, std::move(repository), std::move(engine), std::move(clock))));
}

UploadPipeline::UploadPipeline(core::PipelineConfig config,
                               std::unique_ptr<storage::SessionRepository> repository,
                               std::unique_ptr<scanner::Scanner> engine,
                               core::Clock clock)
    : config_(std::move(config)),
      logger_(std::make_unique<events::LoggerComponent>(bus_)),
      metrics_(std::make_unique<events::MetricsComponent>(bus_)),
      repository_(std::move(repository)),
      chunks_(std::make_unique<storage::FileChunkStore>(config_.storage.chunk_root)),
      durable_(std::make_unique<storage::LocalDurableStorage>(config_.storage.asset_root)),
      scanner_(std::move(engine)) {
    assembler_ = std::make_unique<Assembler>(*repository_, *chunks_, config_.storage.assembly_root, bus_, clock);
    gateway_ = std::make_unique<ScannerGateway>(*repository_, *scanner_, bus_, clock);
    finalizer_ = std::make_unique<Finalizer>(*repository_, *durable_, bus_, clock);
    sweeper_ = std::make_unique<CleanupSweeper>(*repository_, *chunks_, config_.cleanup, bus_, clock);
    runner_ = std::make_unique<JobRunner>(config_.worker_threads, config_.retry);
    service_ = std::make_unique<UploadService>(config_, *repository_, *chunks_, *assembler_, *gateway_,
                                               *finalizer_, *runner_, bus_, clock);
}

UploadPipeline::~UploadPipeline() {
    sweeper_->stop();
    runner_->stop();
}

} // namespace upl::pipeline
