/**
 * @file logging.cpp
 * @brief spdlog default-logger installation.
 */
#include "strangler/obs/logging.hpp"
#include "strangler/config/constants.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace strangler::obs {

    bool init_logging(std::string_view service, std::string_view level) {
        auto logger = spdlog::stdout_color_mt(std::string(service));
        logger->set_pattern(std::string(config::constants::LOG_PATTERN));
        spdlog::set_default_logger(logger);

        // from_str maps unknown names to "off"; detect that explicitly.
        const std::string lvl(level);
        const auto parsed = spdlog::level::from_str(lvl);
        const bool known = parsed != spdlog::level::off || lvl == "off";
        spdlog::set_level(known ? parsed : spdlog::level::info);
        if (!known) {
            spdlog::warn("Unknown LOG_LEVEL '{}', using info", lvl);
        }
        return known;
    }

} // namespace strangler::obs
