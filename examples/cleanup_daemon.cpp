/**
 * Runs the cleanup sweeper on its schedule until SIGINT or SIGTERM.
 *
 * Usage: cleanup_daemon [config.json]
 *
 * The sweeper works on the SQLite database named in the config, so it can
 * run beside the processes that accept uploads.
 */

#include "upl/core/config.hpp"
#include "upl/core/logging.hpp"
#include "upl/events/components.hpp"
#include "upl/events/event_bus.hpp"
#include "upl/pipeline/cleanup_sweeper.hpp"
#include "upl/storage/chunk_store.hpp"
#include "upl/storage/sqlite_repository.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>

int main(int argc, char* argv[]) {
    upl::core::PipelineConfig config;
    if (argc > 1) {
        auto loaded = upl::core::load_config(argv[1]);
        if (loaded.is_error()) {
            std::cerr << "Cannot load " << argv[1] << ": " << upl::describe(loaded.error()) << "\n";
            return 1;
        }
        config = loaded.value();
    }
    upl::core::init_logging(config.logging);

    auto opened = upl::storage::SqliteRepository::open(config.storage.database_path);
    if (opened.is_error()) {
        spdlog::error("Cannot open {}: {}", config.storage.database_path.string(), upl::describe(opened.error()));
        return 1;
    }
    auto& repository = *opened.value();

    upl::events::EventBus bus;
    upl::events::LoggerComponent logger(bus);
    upl::events::MetricsComponent metrics(bus);

    upl::storage::FileChunkStore chunks(config.storage.chunk_root);
    upl::pipeline::CleanupSweeper sweeper(repository, chunks, config.cleanup, bus);

    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Signal {} received, stopping sweeper", signal_number);
        sweeper.stop();
        io.stop();
    });

    spdlog::info("Cleanup daemon on {} (every {}s, batches of {})",
                 config.storage.database_path.string(), config.cleanup.interval.count(), config.cleanup.batch_size);
    sweeper.start(io);
    io.run();

    metrics.print_stats();
    return 0;
}
