#pragma once

#include "upl/core/result.hpp"
#include "upl/core/time.hpp"
#include "upl/events/event_bus.hpp"
#include "upl/model/types.hpp"
#include "upl/scanner/scanner.hpp"
#include "upl/storage/session_repository.hpp"

#include <filesystem>
#include <string>

namespace upl::pipeline {

enum class ScanVerdict { Clean, Infected, Skipped };

const char* to_string(ScanVerdict verdict);

struct ScanOutcome {
    ScanVerdict verdict = ScanVerdict::Clean;
    scanner::ScanResult result;
    model::UploadSession session;
};

/**
 * @brief Runs the scanner on an assembled file and records the verdict
 *
 * VERDICT HANDLING (session must be `virus_scanning`):
 * - clean                -> completed, virus_scan.status = "clean"
 * - infected             -> virus_scan_failed, assembled file deleted
 * - scanner unavailable  -> completed, virus_scan.status = "skipped"
 * - file not found       -> virus_scan_failed, FileNotFound returned
 * - timeout / unexpected -> annotated, error returned for a retry;
 *                           fail() lands virus_scan_failed once retries run out
 *
 * A verdict arriving after cancellation loses the status swap and is
 * dropped; the assembled file is removed.
 */
class ScannerGateway {
public:
    ScannerGateway(storage::SessionRepository& repository,
                   scanner::Scanner& scanner,
                   events::EventBus& bus,
                   core::Clock clock = core::system_clock());

    upl::Result<scanner::ScanResult> scan(const std::filesystem::path& file_path);

    upl::Result<ScanOutcome> process(const std::string& session_id);

    upl::Result<model::UploadSession> fail(const std::string& session_id, const upl::Error& error);

private:
    upl::Result<model::UploadSession> commit(const model::UploadSession& session,
                                             model::SessionStatus to,
                                             nlohmann::json scan_payload,
                                             const std::string& event_type,
                                             std::optional<std::string> error_message);

    upl::Error lost_swap(const model::UploadSession& session) const;

    static void discard_file(const model::UploadSession& session);

    storage::SessionRepository& repository_;
    scanner::Scanner& scanner_;
    events::EventBus& bus_;
    core::Clock clock_;
};

} // namespace upl::pipeline
