#include "upl/session/state_machine.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace upl::session {
namespace {

const std::unordered_map<SessionStatus, std::vector<SessionStatus>>& transition_table() {
    static const std::unordered_map<SessionStatus, std::vector<SessionStatus>> transitions {
        {SessionStatus::Pending, {SessionStatus::Uploading, SessionStatus::Assembling,
                                  SessionStatus::Failed, SessionStatus::Cancelled}},
        {SessionStatus::Uploading, {SessionStatus::Assembling, SessionStatus::Failed, SessionStatus::Cancelled}},
        {SessionStatus::Assembling, {SessionStatus::VirusScanning, SessionStatus::Failed, SessionStatus::Cancelled}},
        {SessionStatus::VirusScanning, {SessionStatus::Completed, SessionStatus::VirusScanFailed,
                                        SessionStatus::Cancelled}},
        {SessionStatus::Completed, {SessionStatus::FinalizationFailed}},
    };
    return transitions;
}

} // namespace

bool can_transition(SessionStatus from, SessionStatus to) noexcept {
    const auto& transitions = transition_table();
    const auto it = transitions.find(from);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), to) != allowed_list.end();
}

upl::Result<void> validate_transition(SessionStatus from, SessionStatus to) {
    if (!can_transition(from, to)) {
        return upl::Err<void>(ErrorKind::InvalidTransition,
                              std::string("Illegal session transition ") + model::to_string(from) +
                              " -> " + model::to_string(to));
    }
    return upl::Ok();
}

std::vector<SessionStatus> allowed_targets(SessionStatus from) {
    const auto& transitions = transition_table();
    const auto it = transitions.find(from);
    return it == transitions.end() ? std::vector<SessionStatus>{} : it->second;
}

bool is_terminal(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Failed:
        case SessionStatus::FinalizationFailed:
        case SessionStatus::VirusScanFailed:
        case SessionStatus::Cancelled:
            return true;
        default:
            return false;
    }
}

bool holds_filename_slot(SessionStatus status) noexcept {
    return status == SessionStatus::Pending ||
           status == SessionStatus::Uploading ||
           status == SessionStatus::Assembling ||
           status == SessionStatus::VirusScanning;
}

const std::vector<SessionStatus>& slot_holding_statuses() {
    static const std::vector<SessionStatus> statuses{
        SessionStatus::Pending, SessionStatus::Uploading,
        SessionStatus::Assembling, SessionStatus::VirusScanning};
    return statuses;
}

bool is_cancellable(SessionStatus status) noexcept {
    return can_transition(status, SessionStatus::Cancelled);
}

bool accepts_chunks(SessionStatus status) noexcept {
    return status == SessionStatus::Pending || status == SessionStatus::Uploading;
}

} // namespace upl::session
