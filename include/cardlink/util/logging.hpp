#pragma once

#include "cardlink/common.hpp"
#include "cardlink/config/config.hpp"
#include "cardlink/util/error_handler.hpp"

namespace cardlink::util {

// Installs the default spdlog logger: a rotating file sink at the configured
// level and a coloured stderr sink at warn. Falls back to stderr only when the
// log file cannot be opened. Also routes ErrorHandler reports to the logger.
Result<void> setupLogging(const config::Config& config);

// Raises the stderr sink to debug (verbose) or drops it to errors only (quiet)
void setConsoleVerbosity(bool verbose, bool quiet);

void logContextualError(const ContextualError& error);

}  // namespace cardlink::util
