#pragma once

/**
 * @file event_log.hpp
 * @brief Append-only outcome log per upload session
 *
 * WHY THIS FILE EXISTS:
 * Several stages annotate the same session (assembly, scan verdict,
 * finalization, cleanup). Writing one shared metadata blob would let a
 * late writer clobber keys another stage just wrote. Instead each stage
 * appends an event and readers fold the log into the current view.
 *
 * FOLD RULES:
 * - Events apply in sequence order
 * - An event with an empty `key` merge-patches the root object
 * - Otherwise its payload merge-patches `view[key]`
 * - A null value in a payload removes that field (RFC 7386)
 *
 * EXAMPLE:
 * {key: "virus_scan", payload: {status: "queued", queued_at: "..."}}
 * {key: "virus_scan", payload: {status: "clean", scanner: "clamav"}}
 * folds to  virus_scan: {status: "clean", scanner: "clamav", queued_at: "..."}
 */

#include "upl/core/time.hpp"
#include "upl/model/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace upl::session {

namespace keys {
inline constexpr const char* kRoot = "";
inline constexpr const char* kAssembly = "assembly";
inline constexpr const char* kVirusScan = "virus_scan";
inline constexpr const char* kFinalization = "finalization";
inline constexpr const char* kCancellation = "cancellation";
inline constexpr const char* kCleanup = "cleanup";
inline constexpr const char* kFailure = "failure";
inline constexpr const char* kScreening = "screening";
} // namespace keys

struct SessionEvent {
    std::uint64_t sequence = 0;          ///< Assigned by the repository on append
    std::string type;                    ///< e.g. "assembly_completed"
    std::string key;                     ///< Metadata key this event patches
    nlohmann::json payload = nlohmann::json::object();
    std::optional<model::SessionStatus> status_after;
    core::TimePoint at{};
};

SessionEvent make_event(std::string type, std::string key, nlohmann::json payload, core::TimePoint at);

/// Current metadata view of a session.
nlohmann::json fold_metadata(const std::vector<SessionEvent>& events);

/// The `finalization.asset_id` recorded in a folded view, if any.
std::optional<std::string> finalized_asset_id(const nlohmann::json& metadata);

/// The `virus_scan.status` recorded in a folded view, or empty.
std::string scan_status(const nlohmann::json& metadata);

nlohmann::json to_json(const SessionEvent& event);

} // namespace upl::session
