#include "upl/pipeline/cleanup_sweeper.hpp"

#include "upl/events/events.hpp"
#include "upl/session/event_log.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace upl::pipeline {
namespace fs = std::filesystem;

using model::SessionStatus;

SweepReport& SweepReport::operator+=(const SweepReport& other) {
    expired_removed += other.expired_removed;
    stuck_failed += other.stuck_failed;
    errors += other.errors;
    duration += other.duration;
    return *this;
}

CleanupSweeper::CleanupSweeper(storage::SessionRepository& repository,
                               storage::ChunkStore& chunks,
                               core::CleanupConfig config,
                               events::EventBus& bus,
                               core::Clock clock)
    : repository_(repository),
      chunks_(chunks),
      config_(std::move(config)),
      bus_(bus),
      clock_(std::move(clock)) {}

CleanupSweeper::~CleanupSweeper() {
    stop();
}

CleanupSweeper::Tally CleanupSweeper::for_each_session(storage::SessionQuery query, const Visitor& visit) {
    Tally tally;
    query.order = storage::SessionQuery::Order::ById;
    query.limit = config_.batch_size;
    query.after_id.reset();

    while (true) {
        auto batch = repository_.find_sessions(query);
        if (batch.is_error()) {
            spdlog::error("[CleanupSweeper] query failed: {}", upl::describe(batch.error()));
            tally.errors++;
            return tally;
        }

        const auto& sessions = batch.value();
        for (const auto& session : sessions) {
            auto visited = visit(session);
            if (visited.is_error()) {
                spdlog::warn("[CleanupSweeper] session={} skipped: {}", session.id, upl::describe(visited.error()));
                tally.errors++;
            } else if (visited.value()) {
                tally.handled++;
            }
        }

        if (sessions.size() < query.limit) {
            return tally;
        }
        query.after_id = sessions.back().id;
    }
}

upl::Result<bool> CleanupSweeper::fail_stuck(const model::UploadSession& session, core::TimePoint now) {
    const bool scanning = session.status == SessionStatus::VirusScanning;
    const auto to = scanning ? SessionStatus::VirusScanFailed : SessionStatus::Failed;
    const auto stuck_for = std::chrono::duration_cast<std::chrono::seconds>(now - session.updated_at);
    const std::string reason = std::string(scanning ? "Virus scan" : "Assembly") +
                               " timed out after " + std::to_string(stuck_for.count()) + "s";

    storage::TransitionRequest request;
    request.expected_from = {session.status};
    request.to = to;
    request.error_message = reason;
    request.at = now;
    request.events.push_back(session::make_event("stuck_session_failed", session::keys::kCleanup, {
        {"reason", reason},
        {"status_before", model::to_string(session.status)},
        {"reaped_at", core::to_iso8601(now)},
    }, now));

    auto committed = repository_.apply_transition(session.id, request);
    if (committed.is_error()) {
        if (committed.error().kind == ErrorKind::InvalidTransition) {
            spdlog::debug("[CleanupSweeper] session={} moved on before reaping", session.id);
            return upl::Ok(false);
        }
        return upl::Err<bool>(committed.error());
    }

    spdlog::warn("[CleanupSweeper] session={} {}: {}", session.id, model::to_string(to), reason);
    bus_.emit(events::SessionFailedEvent{session.id, to, reason});
    return upl::Ok(true);
}

SweepReport CleanupSweeper::sweep_stuck(core::TimePoint now) {
    storage::SessionQuery query;
    query.statuses = {SessionStatus::Assembling, SessionStatus::VirusScanning};
    query.updated_before = now - config_.stuck_assembly_after;

    const auto tally = for_each_session(query, [this, now](const model::UploadSession& session) {
        return fail_stuck(session, now);
    });

    SweepReport report;
    report.stuck_failed = tally.handled;
    report.errors = tally.errors;
    return report;
}

upl::Result<bool> CleanupSweeper::fail_unfinalized(const model::UploadSession& session, core::TimePoint now) {
    auto history = repository_.events(session.id);
    if (history.is_error()) {
        return upl::Err<bool>(history.error());
    }
    if (session::finalized_asset_id(session::fold_metadata(history.value()))) {
        return upl::Ok(false);
    }
    auto asset = repository_.find_asset_by_session(session.id);
    if (asset.is_error()) {
        return upl::Err<bool>(asset.error());
    }
    if (asset.value()) {
        return upl::Ok(false);
    }

    const auto waited = std::chrono::duration_cast<std::chrono::seconds>(now - session.updated_at);
    const std::string reason = "Finalization did not run within " + std::to_string(waited.count()) + "s";

    storage::TransitionRequest request;
    request.expected_from = {SessionStatus::Completed};
    request.to = SessionStatus::FinalizationFailed;
    request.error_message = reason;
    request.at = now;
    request.events.push_back(session::make_event("unfinalized_session_failed", session::keys::kCleanup, {
        {"reason", reason},
        {"status_before", model::to_string(session.status)},
        {"reaped_at", core::to_iso8601(now)},
    }, now));

    auto committed = repository_.apply_transition(session.id, request);
    if (committed.is_error()) {
        if (committed.error().kind == ErrorKind::InvalidTransition) {
            return upl::Ok(false);
        }
        return upl::Err<bool>(committed.error());
    }

    if (!session.assembled_file_path.empty()) {
        std::error_code ec;
        fs::remove(session.assembled_file_path, ec);
        if (ec) {
            spdlog::warn("[CleanupSweeper] session={} assembled file {} not removed: {}",
                         session.id, session.assembled_file_path, ec.message());
        }
    }

    spdlog::warn("[CleanupSweeper] session={} finalization_failed: {}", session.id, reason);
    bus_.emit(events::SessionFailedEvent{session.id, SessionStatus::FinalizationFailed, reason});
    return upl::Ok(true);
}

SweepReport CleanupSweeper::sweep_unfinalized(core::TimePoint now) {
    storage::SessionQuery query;
    query.statuses = {SessionStatus::Completed};
    query.updated_before = now - config_.stuck_assembly_after;

    const auto tally = for_each_session(query, [this, now](const model::UploadSession& session) {
        return fail_unfinalized(session, now);
    });

    SweepReport report;
    report.stuck_failed = tally.handled;
    report.errors = tally.errors;
    return report;
}

upl::Result<void> CleanupSweeper::destroy_session(const model::UploadSession& session) {
    auto removed_chunks = chunks_.remove_session(session.id);
    if (removed_chunks.is_error()) {
        return upl::Err<void>(removed_chunks.error());
    }

    if (!session.assembled_file_path.empty()) {
        std::error_code ec;
        fs::remove(session.assembled_file_path, ec);
        if (ec) {
            spdlog::warn("[CleanupSweeper] session={} assembled file {} not removed: {}",
                         session.id, session.assembled_file_path, ec.message());
        }
    }

    auto removed = repository_.remove_session(session.id);
    if (removed.is_error()) {
        return removed;
    }
    spdlog::debug("[CleanupSweeper] session={} ({}) removed with {} chunk files",
                  session.id, model::to_string(session.status), removed_chunks.value());
    return upl::Ok();
}

SweepReport CleanupSweeper::sweep_expired(core::TimePoint now) {
    struct Rule {
        std::vector<SessionStatus> statuses;
        std::chrono::seconds retention;
    };
    const std::vector<Rule> rules = {
        {{SessionStatus::Pending, SessionStatus::Uploading}, config_.pending_expiry_after},
        {{SessionStatus::Cancelled}, config_.cancelled_retention},
        {{SessionStatus::Failed, SessionStatus::VirusScanFailed, SessionStatus::FinalizationFailed},
         config_.failed_retention},
    };

    SweepReport report;
    for (const auto& rule : rules) {
        storage::SessionQuery query;
        query.statuses = rule.statuses;
        query.updated_before = now - rule.retention;

        const auto tally = for_each_session(query, [this](const model::UploadSession& session) -> upl::Result<bool> {
            auto destroyed = destroy_session(session);
            if (destroyed.is_error()) {
                return upl::Err<bool>(destroyed.error());
            }
            return upl::Ok(true);
        });
        report.expired_removed += tally.handled;
        report.errors += tally.errors;
    }
    return report;
}

SweepReport CleanupSweeper::run_once() {
    const auto started = std::chrono::steady_clock::now();
    const auto now = clock_();

    SweepReport report = sweep_stuck(now);
    report += sweep_unfinalized(now);
    report += sweep_expired(now);
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (report.expired_removed > 0 || report.stuck_failed > 0 || report.errors > 0) {
        spdlog::info("[CleanupSweeper] removed={} stuck_failed={} errors={} in {}ms",
                     report.expired_removed, report.stuck_failed, report.errors, report.duration.count());
    }
    bus_.emit(events::SweepCompletedEvent{report.expired_removed, report.stuck_failed, report.errors,
                                          report.duration});
    return report;
}

void CleanupSweeper::start(boost::asio::io_context& io) {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (running_.exchange(true)) {
        return;
    }
    timer_ = std::make_unique<boost::asio::steady_timer>(io);
    spdlog::info("[CleanupSweeper] scheduled every {}s", config_.interval.count());
    boost::asio::post(io, [this] {
        if (!running_) {
            return;
        }
        run_once();
        schedule_next();
    });
}

void CleanupSweeper::schedule_next() {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (!running_ || !timer_) {
        return;
    }
    timer_->expires_after(config_.interval);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
        }
        run_once();
        schedule_next();
    });
}

void CleanupSweeper::stop() {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (!running_.exchange(false)) {
        return;
    }
    if (timer_) {
        timer_->cancel();
    }
}

} // namespace upl::pipeline
