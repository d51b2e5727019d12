#include "logger.hpp"

#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace raffle {

spdlog::level::level_enum logLevelFromEnvironment() {
    const char* env = std::getenv("RAFFLE_LOG_LEVEL");
    if (env == nullptr || *env == '\0') {
        return spdlog::level::info;
    }
    // Unknown names map to off; treat that as a typo and keep the default.
    auto level = spdlog::level::from_str(env);
    if (level == spdlog::level::off && std::string(env) != "off") {
        return spdlog::level::info;
    }
    return level;
}

Logger createLogger(const std::string& tag) {
    auto logger = spdlog::get(tag);
    if (!logger) {
        logger = spdlog::stdout_color_mt(tag);
        logger->set_level(logLevelFromEnvironment());
    }
    return logger;
}

} // namespace raffle
