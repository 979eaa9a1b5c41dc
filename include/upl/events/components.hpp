/**
 * @file components.hpp
 * @brief Ready-made subscribers for pipeline events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // every stage notification is now logged and counted
 */

#pragma once

#include "upl/events/event_bus.hpp"
#include "upl/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace upl::events {

/**
 * @brief Logs every pipeline event through spdlog
 *
 * Chunk events go to debug; stage outcomes to info; failures to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionCreatedEvent>([](const SessionCreatedEvent& e) {
            spdlog::info("[SessionCreated] session={} workspace={} file={} bytes={} chunks={}",
                         e.session_id, e.workspace_id, e.filename, e.total_size, e.chunks_count);
        });

        bus_.subscribe<ChunkStoredEvent>([](const ChunkStoredEvent& e) {
            spdlog::debug("[ChunkStored] session={} chunk={}/{} bytes={}",
                          e.session_id, e.chunk_number, e.chunks_count, e.bytes);
        });

        bus_.subscribe<AssemblyCompletedEvent>([](const AssemblyCompletedEvent& e) {
            spdlog::info("[AssemblyCompleted] session={} chunks={} bytes={} path={}",
                         e.session_id, e.chunks_count, e.bytes, e.assembled_path);
        });

        bus_.subscribe<ScanCompletedEvent>([](const ScanCompletedEvent& e) {
            if (e.verdict == "infected") {
                spdlog::warn("[ScanCompleted] session={} verdict=infected virus={} scanner={}",
                             e.session_id, e.virus_name, e.scanner);
                return;
            }
            spdlog::info("[ScanCompleted] session={} verdict={} scanner={} duration={}ms",
                         e.session_id, e.verdict, e.scanner, e.duration.count());
        });

        bus_.subscribe<AssetFinalizedEvent>([](const AssetFinalizedEvent& e) {
            spdlog::info("[AssetFinalized] session={} asset={} file={} type={} bytes={}",
                         e.session_id, e.asset_id, e.filename, e.content_type, e.file_size);
        });

        bus_.subscribe<SessionFailedEvent>([](const SessionFailedEvent& e) {
            spdlog::warn("[SessionFailed] session={} status={} reason={}",
                         e.session_id, model::to_string(e.status), e.reason);
        });

        bus_.subscribe<SessionCancelledEvent>([](const SessionCancelledEvent& e) {
            spdlog::info("[SessionCancelled] session={} reason={}", e.session_id, e.reason);
        });

        bus_.subscribe<SweepCompletedEvent>([](const SweepCompletedEvent& e) {
            spdlog::info("[SweepCompleted] expired_removed={} stuck_failed={} errors={} duration={}ms",
                         e.expired_removed, e.stuck_failed, e.errors, e.duration.count());
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counts pipeline outcomes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * ...
 * metrics.get_stats().assets_finalized.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> sessions_created{0};
        std::atomic<std::uint64_t> chunks_stored{0};
        std::atomic<std::uint64_t> bytes_received{0};
        std::atomic<std::uint64_t> assemblies_completed{0};
        std::atomic<std::uint64_t> scans_clean{0};
        std::atomic<std::uint64_t> scans_infected{0};
        std::atomic<std::uint64_t> scans_skipped{0};
        std::atomic<std::uint64_t> assets_finalized{0};
        std::atomic<std::uint64_t> bytes_finalized{0};
        std::atomic<std::uint64_t> sessions_failed{0};
        std::atomic<std::uint64_t> sessions_cancelled{0};
        std::atomic<std::uint64_t> sessions_reaped{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionCreatedEvent>([this](const SessionCreatedEvent&) {
            stats_.sessions_created++;
        });

        bus_.subscribe<ChunkStoredEvent>([this](const ChunkStoredEvent& e) {
            stats_.chunks_stored++;
            stats_.bytes_received += e.bytes;
        });

        bus_.subscribe<AssemblyCompletedEvent>([this](const AssemblyCompletedEvent&) {
            stats_.assemblies_completed++;
        });

        bus_.subscribe<ScanCompletedEvent>([this](const ScanCompletedEvent& e) {
            if (e.verdict == "clean") {
                stats_.scans_clean++;
            } else if (e.verdict == "infected") {
                stats_.scans_infected++;
            } else {
                stats_.scans_skipped++;
            }
        });

        bus_.subscribe<AssetFinalizedEvent>([this](const AssetFinalizedEvent& e) {
            stats_.assets_finalized++;
            stats_.bytes_finalized += e.file_size;
        });

        bus_.subscribe<SessionFailedEvent>([this](const SessionFailedEvent&) {
            stats_.sessions_failed++;
        });

        bus_.subscribe<SessionCancelledEvent>([this](const SessionCancelledEvent&) {
            stats_.sessions_cancelled++;
        });

        bus_.subscribe<SweepCompletedEvent>([this](const SweepCompletedEvent& e) {
            stats_.sessions_reaped += e.expired_removed;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Upload pipeline statistics:");
        spdlog::info("  Sessions created:   {}", stats_.sessions_created.load());
        spdlog::info("  Chunks stored:      {} ({} bytes)", stats_.chunks_stored.load(), stats_.bytes_received.load());
        spdlog::info("  Assemblies:         {}", stats_.assemblies_completed.load());
        spdlog::info("  Scans clean/infected/skipped: {}/{}/{}",
                     stats_.scans_clean.load(), stats_.scans_infected.load(), stats_.scans_skipped.load());
        spdlog::info("  Assets finalized:   {} ({} bytes)", stats_.assets_finalized.load(), stats_.bytes_finalized.load());
        spdlog::info("  Sessions failed:    {}", stats_.sessions_failed.load());
        spdlog::info("  Sessions cancelled: {}", stats_.sessions_cancelled.load());
        spdlog::info("  Sessions reaped:    {}", stats_.sessions_reaped.load());
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace upl::events
