#pragma once

#include "upl/core/config.hpp"

namespace upl::core {

/**
 * @brief Install the process-wide spdlog logger
 *
 * Always logs to a colored stdout sink; adds a rotating file sink when
 * `config.file` is set. Unknown level names fall back to "info".
 * Safe to call more than once; the last call wins.
 */
void init_logging(const LoggingConfig& config);

} // namespace upl::core
