#pragma once
/**
 * @file logging.hpp
 * @brief Process-wide spdlog setup shared by both executables.
 */

#include <string_view>

namespace strangler::obs {

    /**
     * @brief Install a colored stdout logger named @p service as the spdlog default.
     * @param service Logger name shown in every line (e.g. "gateway").
     * @param level spdlog level name; unknown names fall back to info.
     * @return false if @p level was not recognized.
     */
    bool init_logging(std::string_view service, std::string_view level);

} // namespace strangler::obs
