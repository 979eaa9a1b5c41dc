#pragma once

#include "upl/core/result.hpp"
#include "upl/core/time.hpp"
#include "upl/events/event_bus.hpp"
#include "upl/model/types.hpp"
#include "upl/storage/durable_storage.hpp"
#include "upl/storage/session_repository.hpp"

#include <string>

namespace upl::pipeline {

/**
 * @brief Promotes a scanned assembled file into a permanent Asset
 *
 * PRECONDITIONS:
 * - session status is `completed`
 * - folded virus_scan.status is "clean" or "skipped"
 * - the assembled file still exists
 *
 * IDEMPOTENCE:
 * A session maps to at most one Asset. A repeated call returns the asset
 * recorded in finalization.asset_id, or the one the repository already
 * holds for the session if an earlier attempt stopped before recording it.
 */
class Finalizer {
public:
    static constexpr const char* kDefaultContentType = "application/octet-stream";

    Finalizer(storage::SessionRepository& repository,
              storage::DurableStorage& storage,
              events::EventBus& bus,
              core::Clock clock = core::system_clock());

    /// MIME type from the filename extension, case-insensitive.
    [[nodiscard]] static std::string content_type_for(const std::string& filename);

    upl::Result<model::Asset> finalize(const std::string& session_id);

    /// Moves a `completed` session to `finalization_failed`.
    upl::Result<model::UploadSession> fail(const std::string& session_id, const upl::Error& error);

private:
    upl::Result<model::Asset> record_finalization(const model::UploadSession& session, const model::Asset& asset);

    nlohmann::json asset_metadata(const model::UploadSession& session, const nlohmann::json& folded) const;

    storage::SessionRepository& repository_;
    storage::DurableStorage& storage_;
    events::EventBus& bus_;
    core::Clock clock_;
};

} // namespace upl::pipeline
