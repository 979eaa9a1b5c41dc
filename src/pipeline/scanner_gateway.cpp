#include "upl/pipeline/scanner_gateway.hpp"

#include "upl/events/events.hpp"
#include "upl/session/event_log.hpp"

#include <spdlog/spdlog.h>

namespace upl::pipeline {
namespace fs = std::filesystem;

using model::SessionStatus;

const char* to_string(ScanVerdict verdict) {
    switch (verdict) {
        case ScanVerdict::Clean: return "clean";
        case ScanVerdict::Infected: return "infected";
        case ScanVerdict::Skipped: return "skipped";
    }
    return "unknown";
}

ScannerGateway::ScannerGateway(storage::SessionRepository& repository,
                               scanner::Scanner& scanner,
                               events::EventBus& bus,
                               core::Clock clock)
    : repository_(repository), scanner_(scanner), bus_(bus), clock_(std::move(clock)) {}

upl::Result<scanner::ScanResult> ScannerGateway::scan(const fs::path& file_path) {
    std::error_code ec;
    if (file_path.empty() || !fs::is_regular_file(file_path, ec)) {
        return upl::Err<scanner::ScanResult>(ErrorKind::FileNotFound,
                                             "Assembled file not found: " + file_path.string());
    }
    return scanner_.scan(file_path);
}

void ScannerGateway::discard_file(const model::UploadSession& session) {
    if (session.assembled_file_path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(session.assembled_file_path, ec);
    if (ec) {
        spdlog::warn("[ScannerGateway] session={} could not delete {}: {}",
                     session.id, session.assembled_file_path, ec.message());
    }
}

upl::Error ScannerGateway::lost_swap(const model::UploadSession& session) const {
    auto current = repository_.get_session(session.id);
    if (current.is_ok() && current.value().status == SessionStatus::Cancelled) {
        discard_file(session);
        return upl::Error{ErrorKind::Cancelled, "Session " + session.id + " was cancelled during scanning"};
    }
    const std::string status = current.is_ok() ? model::to_string(current.value().status) : "unknown";
    return upl::Error{ErrorKind::InvalidTransition,
                      "Session " + session.id + " is no longer virus_scanning (" + status + ")"};
}

upl::Result<model::UploadSession> ScannerGateway::commit(const model::UploadSession& session,
                                                         SessionStatus to,
                                                         nlohmann::json scan_payload,
                                                         const std::string& event_type,
                                                         std::optional<std::string> error_message) {
    const auto now = clock_();
    scan_payload["completed_at"] = core::to_iso8601(now);

    storage::TransitionRequest request;
    request.expected_from = {SessionStatus::VirusScanning};
    request.to = to;
    request.scan_completed_at = now;
    request.error_message = std::move(error_message);
    request.at = now;
    request.events.push_back(session::make_event(event_type, session::keys::kVirusScan, std::move(scan_payload), now));

    auto committed = repository_.apply_transition(session.id, request);
    if (committed.is_error()) {
        return upl::Err<model::UploadSession>(lost_swap(session));
    }
    return committed;
}

upl::Result<ScanOutcome> ScannerGateway::process(const std::string& session_id) {
    auto loaded = repository_.get_session(session_id);
    if (loaded.is_error()) {
        return upl::Err<ScanOutcome>(loaded.error());
    }
    const auto session = loaded.value();
    if (session.status != SessionStatus::VirusScanning) {
        if (session.status == SessionStatus::Cancelled) {
            discard_file(session);
            return upl::Err<ScanOutcome>(ErrorKind::Cancelled, "Session " + session_id + " was cancelled");
        }
        return upl::Err<ScanOutcome>(ErrorKind::InvalidTransition,
            "Session " + session_id + " is " + model::to_string(session.status) + ", not virus_scanning");
    }

    auto scanned = scan(session.assembled_file_path);

    if (scanned.is_ok()) {
        const auto& result = scanned.value();
        ScanOutcome outcome;
        outcome.result = result;

        if (result.clean) {
            auto committed = commit(session, SessionStatus::Completed, {
                {"status", "clean"},
                {"scanner", result.scanner},
                {"duration_ms", result.duration.count()},
                {"file_size", result.file_size},
                {"error", nullptr},
            }, "scan_clean", std::nullopt);
            if (committed.is_error()) {
                return upl::Err<ScanOutcome>(committed.error());
            }
            outcome.verdict = ScanVerdict::Clean;
            outcome.session = committed.value();
            bus_.emit(events::ScanCompletedEvent{session_id, "clean", result.scanner, "", result.duration});
            return upl::Ok(std::move(outcome));
        }

        const std::string reason = "Virus detected: " + result.virus_name;
        auto committed = commit(session, SessionStatus::VirusScanFailed, {
            {"status", "infected"},
            {"scanner", result.scanner},
            {"virus_name", result.virus_name},
            {"duration_ms", result.duration.count()},
            {"error", reason},
        }, "scan_infected", reason);
        if (committed.is_error()) {
            return upl::Err<ScanOutcome>(committed.error());
        }
        discard_file(session);
        outcome.verdict = ScanVerdict::Infected;
        outcome.session = committed.value();
        bus_.emit(events::ScanCompletedEvent{session_id, "infected", result.scanner, result.virus_name,
                                             result.duration});
        bus_.emit(events::SessionFailedEvent{session_id, SessionStatus::VirusScanFailed, reason});
        return upl::Ok(std::move(outcome));
    }

    const auto& error = scanned.error();
    switch (error.kind) {
        case ErrorKind::ScannerUnavailable: {
            auto committed = commit(session, SessionStatus::Completed, {
                {"status", "skipped"},
                {"scanner", scanner_.name()},
                {"error", error.message},
            }, "scan_skipped", std::nullopt);
            if (committed.is_error()) {
                return upl::Err<ScanOutcome>(committed.error());
            }
            spdlog::warn("[ScannerGateway] session={} scan skipped: {}", session_id, error.message);
            ScanOutcome outcome;
            outcome.verdict = ScanVerdict::Skipped;
            outcome.result.scanner = scanner_.name();
            outcome.session = committed.value();
            bus_.emit(events::ScanCompletedEvent{session_id, "skipped", scanner_.name(), "",
                                                 std::chrono::milliseconds{0}});
            return upl::Ok(std::move(outcome));
        }

        case ErrorKind::FileNotFound: {
            auto committed = commit(session, SessionStatus::VirusScanFailed, {
                {"status", "error"},
                {"scanner", scanner_.name()},
                {"error", error.message},
            }, "scan_failed", error.message);
            if (committed.is_error()) {
                return upl::Err<ScanOutcome>(committed.error());
            }
            bus_.emit(events::SessionFailedEvent{session_id, SessionStatus::VirusScanFailed, error.message});
            return upl::Err<ScanOutcome>(error);
        }

        default: {
            const auto now = clock_();
            auto noted = repository_.append_event(session_id,
                session::make_event("scan_attempt_failed", session::keys::kVirusScan, {
                    {"status", "retrying"},
                    {"scanner", scanner_.name()},
                    {"error", error.message},
                    {"error_kind", upl::to_string(error.kind)},
                    {"last_attempt_at", core::to_iso8601(now)},
                }, now),
                {SessionStatus::VirusScanning});
            if (noted.is_error()) {
                return upl::Err<ScanOutcome>(lost_swap(session));
            }
            spdlog::warn("[ScannerGateway] session={} scan attempt failed: {}", session_id, upl::describe(error));
            return upl::Err<ScanOutcome>(error);
        }
    }
}

upl::Result<model::UploadSession> ScannerGateway::fail(const std::string& session_id, const upl::Error& error) {
    auto loaded = repository_.get_session(session_id);
    if (loaded.is_error()) {
        return loaded;
    }
    const auto reason = "Virus scan failed: " + error.message;
    auto committed = commit(loaded.value(), SessionStatus::VirusScanFailed, {
        {"status", "error"},
        {"scanner", scanner_.name()},
        {"error", reason},
        {"error_kind", upl::to_string(error.kind)},
    }, "scan_failed", reason);
    if (committed.is_ok()) {
        bus_.emit(events::SessionFailedEvent{session_id, SessionStatus::VirusScanFailed, reason});
    }
    return committed;
}

} // namespace upl::pipeline
