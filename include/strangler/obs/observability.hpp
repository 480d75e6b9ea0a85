#pragma once
/**
 * @file observability.hpp
 * @brief Routing decision sink: per-origin counters plus one log line per decision.
 */

#include <array>
#include <cstdint>
#include <mutex>

#include "strangler/routing/migration_router.hpp"
#include "strangler/routing/origin.hpp"

namespace strangler::obs {

    /** @struct Counters
     *  @brief Process-level counters for routing decisions.
     */
    struct Counters {
        uint64_t decisions{0};          ///< Total decisions recorded
        uint64_t migrated{0};           ///< Movies requests sent to movies-service by roll
        uint64_t movies_on_monolith{0}; ///< Movies requests kept on the monolith
        std::array<uint64_t, routing::OriginCount> by_origin{}; ///< Indexed by routing::index_of
        std::array<uint64_t, routing::OriginCount> forward_failures{}; ///< Upstream errors mapped to 502

        uint64_t for_origin(routing::Origin o) const noexcept { return by_origin[routing::index_of(o)]; }
        uint64_t failures_for(routing::Origin o) const noexcept { return forward_failures[routing::index_of(o)]; }
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single decision.
        virtual void record(const routing::RoutingDecision& d) = 0;
        /// Record an upstream failure for an origin.
        virtual void record_forward_failure(routing::Origin o) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /** @class LoggingObserver
     *  @brief spdlog-backed Observer; counts under a mutex.
     */
    class LoggingObserver final : public Observer {
    public:
        void record(const routing::RoutingDecision& d) override;
        void record_forward_failure(routing::Origin o) override;
        Counters snapshot() const override;

    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

} // namespace strangler::obs
