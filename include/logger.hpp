#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace raffle {

using Logger = std::shared_ptr<spdlog::logger>;

// Returns the logger registered under tag, creating a colored stdout logger on
// first use. The level comes from RAFFLE_LOG_LEVEL (default "info").
Logger createLogger(const std::string& tag);

spdlog::level::level_enum logLevelFromEnvironment();

} // namespace raffle
