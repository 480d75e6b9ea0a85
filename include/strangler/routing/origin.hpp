/**
 * @file origin.hpp
 * @brief Upstream origins the gateway can forward to.
 *
 * The gateway only ever knows three origins. The enum is the routing result;
 * the URL behind each origin comes from configuration.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace strangler::routing {

/**
 * @brief Forwarding target selected for a request.
 */
enum class Origin : std::uint8_t {
  Monolith = 0,
  MoviesService = 1,
  EventsService = 2
};

inline constexpr std::size_t OriginCount = 3;

/// Stable label used in logs and counters.
constexpr std::string_view to_string(Origin o) noexcept {
  switch (o) {
    case Origin::Monolith:      return "monolith";
    case Origin::MoviesService: return "movies-service";
    case Origin::EventsService: return "events-service";
  }
  return "unknown";
}

constexpr std::size_t index_of(Origin o) noexcept {
  return static_cast<std::size_t>(o);
}

inline constexpr std::array<Origin, OriginCount> AllOrigins{
  Origin::Monolith, Origin::MoviesService, Origin::EventsService
};

} // namespace strangler::routing
