/**
 * @file migration_router.cpp
 * @brief Implementation of MigrationRouter.
 */
#include "strangler/routing/migration_router.hpp"

#include <algorithm>

namespace strangler::routing {

using namespace strangler::config::constants;

std::string_view to_string(RouteReason r) noexcept {
    switch (r) {
        case RouteReason::Migrated:     return "migration";
        case RouteReason::MoviesLegacy: return "movies_on_monolith";
        case RouteReason::Events:       return "events";
        case RouteReason::Fallback:     return "default";
    }
    return "unknown";
}

MigrationRouter::MigrationRouter(MigrationConfig cfg, RandomSource& rng) noexcept
    : cfg_(cfg), rng_(&rng) {
    cfg_.percent = std::clamp(cfg_.percent, MIGRATION_PCT_MIN, MIGRATION_PCT_MAX);
}

bool MigrationRouter::has_prefix(std::string_view path, std::string_view prefix) noexcept {
    return path.substr(0, prefix.size()) == prefix;
}

RoutingDecision MigrationRouter::decide(std::string_view path) const {
    RoutingDecision d;
    d.path = std::string(path);

    if (has_prefix(path, MOVIES_PATH_PREFIX)) {
        if (cfg_.enabled) {
            // Fresh draw per request; no per-client stickiness.
            const int roll = rng_->roll(MIGRATION_ROLL_RANGE);
            d.roll = roll;
            if (roll < cfg_.percent) {
                d.origin = Origin::MoviesService;
                d.reason = RouteReason::Migrated;
                return d;
            }
        }
        d.origin = Origin::Monolith;
        d.reason = RouteReason::MoviesLegacy;
        return d;
    }

    if (has_prefix(path, EVENTS_PATH_PREFIX)) {
        d.origin = Origin::EventsService;
        d.reason = RouteReason::Events;
        return d;
    }

    d.origin = Origin::Monolith;
    d.reason = RouteReason::Fallback;
    return d;
}

} // namespace strangler::routing
