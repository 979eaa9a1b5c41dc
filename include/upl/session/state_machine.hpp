#pragma once

#include "upl/core/result.hpp"
#include "upl/model/types.hpp"

#include <vector>

namespace upl::session {

using model::SessionStatus;

/// True when `from -> to` is an edge of the upload lifecycle.
[[nodiscard]] bool can_transition(SessionStatus from, SessionStatus to) noexcept;

/// Same check, reported as InvalidTransition with both status names.
upl::Result<void> validate_transition(SessionStatus from, SessionStatus to);

[[nodiscard]] std::vector<SessionStatus> allowed_targets(SessionStatus from);

[[nodiscard]] bool is_terminal(SessionStatus status) noexcept;

/// Sessions in these statuses own their (workspace, container, filename) slot.
[[nodiscard]] bool holds_filename_slot(SessionStatus status) noexcept;

[[nodiscard]] const std::vector<SessionStatus>& slot_holding_statuses();

/// Statuses from which a client may still cancel.
[[nodiscard]] bool is_cancellable(SessionStatus status) noexcept;

[[nodiscard]] bool accepts_chunks(SessionStatus status) noexcept;

} // namespace upl::session
