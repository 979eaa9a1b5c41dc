#pragma once

#include "upl/core/config.hpp"
#include "upl/core/result.hpp"
#include "upl/core/time.hpp"
#include "upl/events/event_bus.hpp"
#include "upl/model/types.hpp"
#include "upl/storage/chunk_store.hpp"
#include "upl/storage/session_repository.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace upl::pipeline {

struct SweepReport {
    std::size_t expired_removed = 0;
    std::size_t stuck_failed = 0;
    std::size_t errors = 0;
    std::chrono::milliseconds duration{0};

    SweepReport& operator+=(const SweepReport& other);
};

/**
 * @brief Recurring reaper for abandoned and stuck sessions
 *
 * EXPIRED SWEEP (session and its chunk files are destroyed):
 * - pending/uploading not touched for `pending_expiry_after`
 * - cancelled older than `cancelled_retention`
 * - failed, virus_scan_failed, finalization_failed older than `failed_retention`
 *
 * STUCK SWEEP (session is force-failed, releasing its filename slot):
 * - assembling longer than `stuck_assembly_after` -> failed
 * - virus_scanning longer than `stuck_assembly_after` -> virus_scan_failed
 * - completed without an asset for `stuck_assembly_after` -> finalization_failed,
 *   and the assembled file is deleted
 *
 * Sessions are read in batches of `batch_size` with an id cursor. One
 * session failing to clean up is logged and counted; the batch goes on.
 */
class CleanupSweeper {
public:
    CleanupSweeper(storage::SessionRepository& repository,
                   storage::ChunkStore& chunks,
                   core::CleanupConfig config,
                   events::EventBus& bus,
                   core::Clock clock = core::system_clock());
    ~CleanupSweeper();

    CleanupSweeper(const CleanupSweeper&) = delete;
    CleanupSweeper& operator=(const CleanupSweeper&) = delete;

    SweepReport run_once();

    SweepReport sweep_stuck(core::TimePoint now);

    /// Completed sessions whose finalization never ran. Every completed
    /// session past the threshold is visited, finalized ones included.
    SweepReport sweep_unfinalized(core::TimePoint now);

    SweepReport sweep_expired(core::TimePoint now);

    /// Deletes chunk files, the assembled file and the session record.
    upl::Result<void> destroy_session(const model::UploadSession& session);

    /// Runs run_once() every `interval` on the given io_context until stop().
    void start(boost::asio::io_context& io);
    void stop();

private:
    /// Ok(true) handled, Ok(false) skipped, error counted and logged.
    using Visitor = std::function<upl::Result<bool>(const model::UploadSession&)>;

    struct Tally {
        std::size_t handled = 0;
        std::size_t errors = 0;
    };

    Tally for_each_session(storage::SessionQuery query, const Visitor& visit);

    upl::Result<bool> fail_stuck(const model::UploadSession& session, core::TimePoint now);

    upl::Result<bool> fail_unfinalized(const model::UploadSession& session, core::TimePoint now);

    void schedule_next();

    storage::SessionRepository& repository_;
    storage::ChunkStore& chunks_;
    core::CleanupConfig config_;
    events::EventBus& bus_;
    core::Clock clock_;

    std::mutex timer_mutex_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
    std::atomic<bool> running_{false};
};

} // namespace upl::pipeline
