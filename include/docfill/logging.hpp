#pragma once

namespace docfill {

// Routes the default spdlog logger to stderr. verbose selects debug level,
// otherwise info; SPDLOG_LEVEL from the environment overrides both.
void setupLogging(bool verbose);

} // namespace docfill
