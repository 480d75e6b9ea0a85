/**
* @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "strangler/obs/observability.hpp"

#include <spdlog/spdlog.h>

namespace strangler::obs {

    using routing::Origin;
    using routing::RouteReason;

    void LoggingObserver::record(const routing::RoutingDecision& d) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.decisions++;
            ctr_.by_origin[routing::index_of(d.origin)]++;
            if (d.reason == RouteReason::Migrated) ctr_.migrated++;
            if (d.reason == RouteReason::MoviesLegacy) ctr_.movies_on_monolith++;
        }

        switch (d.reason) {
            case RouteReason::Migrated:
                spdlog::info("Routing to movies-service (migration)");
                break;
            case RouteReason::MoviesLegacy:
                spdlog::info("Routing to monolith");
                break;
            case RouteReason::Events:
                spdlog::info("Routing to events-service");
                break;
            case RouteReason::Fallback:
                spdlog::info("Routing to monolith (default)");
                break;
        }
        if (d.roll) {
            spdlog::debug("migration roll={} path={}", *d.roll, d.path);
        }
    }

    void LoggingObserver::record_forward_failure(Origin o) {
        std::lock_guard<std::mutex> lk(mu_);
        ctr_.forward_failures[routing::index_of(o)]++;
    }

    Counters LoggingObserver::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

} // namespace strangler::obs
