/**
 * @file gateway.cpp
 * @brief Gateway request handling.
 */
#include "strangler/proxy/gateway.hpp"
#include "strangler/config/constants.hpp"

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace strangler::proxy {

using namespace strangler::config::constants;

Gateway::Gateway(const routing::MigrationRouter& router, UpstreamSet upstreams, obs::Observer& observer)
    : router_(&router), upstreams_(std::move(upstreams)), observer_(&observer) {
    for (auto o : routing::AllOrigins) {
        if (!upstreams_[routing::index_of(o)]) {
            throw std::invalid_argument("missing upstream for " + std::string(routing::to_string(o)));
        }
    }
}

bool Gateway::is_health_path(std::string_view path) noexcept {
    return path == GATEWAY_HEALTH_PATH;
}

HttpResponse Gateway::health() {
    return text_response(status::Ok, std::string(GATEWAY_HEALTH_BODY));
}

HttpResponse Gateway::handle(const HttpRequest& req) const {
    if (is_health_path(req.path)) return health();

    spdlog::info("Incoming request: {} {}", req.method, req.path);
    const auto decision = router_->decide(req.path);
    observer_->record(decision);
    return forward(decision, req);
}

HttpResponse Gateway::forward(const routing::RoutingDecision& d, const HttpRequest& req) const {
    const auto& upstream = upstreams_[routing::index_of(d.origin)];
    auto result = upstream->forward(req);
    if (!result) {
        // Reported to the client as 502; the process keeps serving.
        spdlog::error("proxy error: {} {}", routing::to_string(d.origin), result.error().detail);
        observer_->record_forward_failure(d.origin);
        HttpResponse bad;
        bad.status = status::BadGateway;
        return bad;
    }
    return std::move(*result);
}

} // namespace strangler::proxy
