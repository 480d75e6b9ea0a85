#pragma once
/**
 * @file gateway.hpp
 * @brief Strangler-fig gateway: health check, classify, forward.
 * @details No shared mutable state between requests beyond the observer's
 *          counters. Routing uses immutable config plus one roll per request.
 */

#include <array>
#include <memory>

#include "strangler/obs/observability.hpp"
#include "strangler/proxy/http_types.hpp"
#include "strangler/proxy/upstream.hpp"
#include "strangler/routing/migration_router.hpp"
#include "strangler/routing/origin.hpp"

namespace strangler::proxy {

/// One Upstream per routing::Origin, indexed by routing::index_of.
using UpstreamSet = std::array<std::shared_ptr<Upstream>, routing::OriginCount>;

/** @class Gateway
 *  @brief Request-level logic of the gateway, independent of the HTTP server.
 */
class Gateway {
public:
    /**
     * @param router Classifier; must outlive the gateway.
     * @param upstreams Non-null upstream for every origin.
     * @param observer Decision sink; must outlive the gateway.
     */
    Gateway(const routing::MigrationRouter& router, UpstreamSet upstreams, obs::Observer& observer);

    /// Serve the health path or route and forward. Never throws for upstream failures.
    HttpResponse handle(const HttpRequest& req) const;

    /// Static health answer; does not consult any upstream.
    static HttpResponse health();

    static bool is_health_path(std::string_view path) noexcept;

private:
    HttpResponse forward(const routing::RoutingDecision& d, const HttpRequest& req) const;

    const routing::MigrationRouter* router_;
    UpstreamSet                     upstreams_;
    obs::Observer*                  observer_;
};

} // namespace strangler::proxy
