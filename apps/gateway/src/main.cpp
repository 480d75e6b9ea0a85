/**
 * @file main.cpp
 * @brief Strangler-fig gateway: classify each request by path prefix and
 *        forward it to the monolith, movies-service or events-service.
 *
 * **Bootstrap**
 * - Resolve config from the environment; a malformed upstream URL is fatal.
 * - Seed the migration RandomSource once; build one CurlUpstream per origin.
 *
 * **Serving**
 * - `/health` answers locally on a restbed worker; every other path goes
 *   through Gateway::handle on its own net::Offload thread.
 */

#include <cstdlib>
#include <memory>
#include <string>

#include <restbed>
#include <spdlog/spdlog.h>

#include "strangler/config/config_loader.hpp"
#include "strangler/net/offload.hpp"
#include "strangler/net/restbed_glue.hpp"
#include "strangler/obs/logging.hpp"
#include "strangler/obs/observability.hpp"
#include "strangler/proxy/curl_upstream.hpp"
#include "strangler/proxy/gateway.hpp"
#include "strangler/routing/migration_router.hpp"
#include "strangler/routing/random_source.hpp"
#include "strangler/version.hpp"

using namespace strangler;

int main() {
  config::Loader loader;
  obs::init_logging("gateway", loader.log_level());

  auto cfg = loader.gateway();
  if (!cfg) {
    spdlog::critical("Invalid configuration {}: {}", cfg.error().key, cfg.error().detail);
    return EXIT_FAILURE;
  }

  proxy::CurlGlobal curl_global;
  if (!curl_global.ok()) {
    spdlog::critical("curl_global_init failed");
    return EXIT_FAILURE;
  }

  routing::MtRandomSource rng;
  routing::MigrationRouter router(cfg->migration, rng);
  obs::LoggingObserver observer;

  proxy::UpstreamSet upstreams;
  upstreams[routing::index_of(routing::Origin::Monolith)]      = std::make_shared<proxy::CurlUpstream>(cfg->monolith);
  upstreams[routing::index_of(routing::Origin::MoviesService)] = std::make_shared<proxy::CurlUpstream>(cfg->movies);
  upstreams[routing::index_of(routing::Origin::EventsService)] = std::make_shared<proxy::CurlUpstream>(cfg->events);
  const proxy::Gateway gateway(router, upstreams, observer);

  const net::RequestHandler handler = [&gateway](const proxy::HttpRequest& req) { return gateway.handle(req); };

  // Forwards block on the origin; run them off the restbed workers so /health
  // and other connections never queue behind a slow upstream. Declared after
  // the gateway: in-flight forwards drain before it goes away.
  net::Offload forwards;

  restbed::Service service;
  service.publish(net::make_resource(std::string(config::constants::GATEWAY_HEALTH_PATH), handler));
  service.set_not_found_handler([handler, &forwards](const std::shared_ptr<restbed::Session> session) {
    net::serve(session, handler, &forwards);
  });
  service.set_method_not_allowed_handler([handler, &forwards](const std::shared_ptr<restbed::Session> session) {
    net::serve(session, handler, &forwards);
  });
  net::install_error_handler(service);

  spdlog::info("Strangler Fig Proxy {} started on port {}", version_string, cfg->port);
  spdlog::info("Monolith URL: {}", cfg->monolith.text);
  spdlog::info("Movies Service URL: {}", cfg->movies.text);
  spdlog::info("Events Service URL: {}", cfg->events.text);
  spdlog::info("Gradual migration enabled: {}", router.config().enabled);
  spdlog::info("Movies migration percentage: {}%", router.config().percent);

  try {
    service.start(net::make_settings(cfg->port, cfg->workers));
  } catch (const std::exception& e) {
    spdlog::critical("Failed to start server: {}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
