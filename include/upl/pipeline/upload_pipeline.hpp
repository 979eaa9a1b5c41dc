#pragma once

#include "upl/core/config.hpp"
#include "upl/core/result.hpp"
#include "upl/core/time.hpp"
#include "upl/events/components.hpp"
#include "upl/events/event_bus.hpp"
#include "upl/pipeline/assembler.hpp"
#include "upl/pipeline/cleanup_sweeper.hpp"
#include "upl/pipeline/finalizer.hpp"
#include "upl/pipeline/job_runner.hpp"
#include "upl/pipeline/scanner_gateway.hpp"
#include "upl/pipeline/upload_service.hpp"
#include "upl/scanner/scanner.hpp"
#include "upl/storage/chunk_store.hpp"
#include "upl/storage/durable_storage.hpp"
#include "upl/storage/session_repository.hpp"

#include <memory>

namespace upl::pipeline {

/**
 * @brief Everything a running upload pipeline needs, wired from one config
 *
 * Owns the repository (memory or SQLite), the chunk store, the durable
 * storage, the scanner, the job runner, the event bus with its logger and
 * metrics components, the four stages and the service in front of them.
 * The destructor stops the sweeper timer and the job runner before any
 * stage they call into is destroyed.
 */
class UploadPipeline {
public:
    /// `engine` overrides the one the config would build (clamd or none).
    static upl::Result<std::unique_ptr<UploadPipeline>> create(const core::PipelineConfig& config,
                                                               std::unique_ptr<scanner::Scanner> engine = nullptr,
                                                               core::Clock clock = core::system_clock());

    ~UploadPipeline();

    UploadPipeline(const UploadPipeline&) = delete;
    UploadPipeline& operator=(const UploadPipeline&) = delete;

    UploadService& service() { return *service_; }
    CleanupSweeper& sweeper() { return *sweeper_; }
    JobRunner& runner() { return *runner_; }
    storage::SessionRepository& repository() { return *repository_; }
    storage::ChunkStore& chunks() { return *chunks_; }
    events::EventBus& bus() { return bus_; }
    const events::MetricsComponent& metrics() const { return *metrics_; }
    const core::PipelineConfig& config() const { return config_; }

private:
    UploadPipeline(core::PipelineConfig config,
                   std::unique_ptr<storage::SessionRepository> repository,
                   std::unique_ptr<scanner::Scanner> engine,
                   core::Clock clock);

    core::PipelineConfig config_;
    events::EventBus bus_;
    std::unique_ptr<events::LoggerComponent> logger_;
    std::unique_ptr<events::MetricsComponent> metrics_;
    std::unique_ptr<storage::SessionRepository> repository_;
    std::unique_ptr<storage::ChunkStore> chunks_;
    std::unique_ptr<storage::DurableStorage> durable_;
    std::unique_ptr<scanner::Scanner> scanner_;
    std::unique_ptr<Assembler> assembler_;
    std::unique_ptr<ScannerGateway> gateway_;
    std::unique_ptr<Finalizer> finalizer_;
    std::unique_ptr<CleanupSweeper> sweeper_;
    std::unique_ptr<JobRunner> runner_;
    std::unique_ptr<UploadService> service_;
};

} // namespace upl::pipeline
