#pragma once

#include "ingest/core/config.hpp"
#include "ingest/core/result.hpp"

namespace ingest {

/**
 * @brief Installs the default spdlog logger described by @p config
 *
 * Console output always goes to a colored stdout sink; a rotating file sink
 * is added when config.file is set.
 */
Result<void> configure_logging(const LoggingConfig& config);

} // namespace ingest
