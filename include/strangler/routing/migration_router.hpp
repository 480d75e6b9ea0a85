#pragma once
/**
 * @file migration_router.hpp
 * @brief Path-prefix classification with a percentage canary for the movies API.
 * @details Priority order:
 *          1. `/api/movies*`  -> movies-service when migration is enabled and a
 *             fresh roll in [0,100) is strictly below the percentage, else monolith.
 *          2. `/api/events*`  -> events-service.
 *          3. anything else   -> monolith.
 */

#include <optional>
#include <string>
#include <string_view>

#include "strangler/config/constants.hpp"
#include "strangler/routing/origin.hpp"
#include "strangler/routing/random_source.hpp"

namespace strangler::routing {

/** @struct MigrationConfig
 *  @brief Canary settings for the movies capability.
 */
struct MigrationConfig {
    bool enabled{strangler::config::constants::GATEWAY_DEFAULT_MIGRATION};     ///< Gradual migration switch
    int  percent{strangler::config::constants::GATEWAY_DEFAULT_MIGRATION_PCT}; ///< Share routed to movies-service [0,100]
};

/** @enum RouteReason
 *  @brief Which rule produced a decision.
 */
enum class RouteReason : uint8_t {
    Migrated,     ///< Movies path, roll below percentage
    MoviesLegacy, ///< Movies path kept on the monolith
    Events,       ///< Events path
    Fallback      ///< No prefix matched
};

std::string_view to_string(RouteReason r) noexcept;

/** @struct RoutingDecision
 *  @brief Outcome of classifying one request. Lives for one request only.
 */
struct RoutingDecision {
    std::string      path;           ///< Request path as received
    Origin           origin{Origin::Monolith};
    RouteReason      reason{RouteReason::Fallback};
    std::optional<int> roll;         ///< Set only when a migration roll was drawn
};

/** @class MigrationRouter
 *  @brief Stateless classifier over immutable config plus an injected RandomSource.
 */
class MigrationRouter {
public:
    /**
     * @param cfg Migration settings; the percentage is clamped to [0,100].
     * @param rng Roll source; must outlive the router.
     */
    MigrationRouter(MigrationConfig cfg, RandomSource& rng) noexcept;

    /// Classify one request path. Draws at most one roll.
    RoutingDecision decide(std::string_view path) const;

    const MigrationConfig& config() const noexcept { return cfg_; }

    static bool has_prefix(std::string_view path, std::string_view prefix) noexcept;

private:
    MigrationConfig cfg_;
    RandomSource*   rng_;
};

} // namespace strangler::routing
