#include "docfill/logging.hpp"

#include <memory>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace docfill {

void setupLogging(bool verbose) {
  auto logger = spdlog::default_logger();
  logger->sinks() = {};
  logger->sinks().push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
  logger->set_pattern("%^%l%$: %v");
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::cfg::load_env_levels();
}

} // namespace docfill
