/**
 * @file main.cpp
 * @brief Event ingestion sidecar.
 *
 * Producer side: POST /api/events/{movie,user,payment} decode, re-serialize and
 * publish synchronously to the kind's topic through one shared KafkaPublisher.
 *
 * Consumer side: one loop per topic, all in one consumer group, started before
 * the HTTP server and running independently of it. main returns only after the
 * server stops and every loop has exited.
 */

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <restbed>
#include <spdlog/spdlog.h>

#include "strangler/config/config_loader.hpp"
#include "strangler/config/constants.hpp"
#include "strangler/events/consumer_loop.hpp"
#include "strangler/events/event_types.hpp"
#include "strangler/events/ingest_handler.hpp"
#include "strangler/events/kafka_broker.hpp"
#include "strangler/net/restbed_glue.hpp"
#include "strangler/obs/logging.hpp"

using namespace strangler;
using namespace strangler::config::constants;

namespace {

std::shared_ptr<restbed::Resource> ingest_resource(std::string_view path, const events::IngestEndpoint& endpoint) {
  return net::make_resource(std::string(path), [&endpoint](const proxy::HttpRequest& req) {
    return endpoint.handle(req.method, req.body);
  });
}

} // namespace

int main() {
  config::Loader loader;
  obs::init_logging("event-pipeline", loader.log_level());

  auto cfg = loader.pipeline();
  if (!cfg) {
    spdlog::critical("Invalid configuration {}: {}", cfg.error().key, cfg.error().detail);
    return EXIT_FAILURE;
  }

  auto publisher = events::KafkaPublisher::create(cfg->bootstrap);
  if (!publisher) {
    spdlog::critical("Failed to create Kafka producer: {}", publisher.error().detail);
    return EXIT_FAILURE;
  }

  events::ConsumerSupervisor consumers(events::kafka_source_factory(cfg->bootstrap, cfg->group_id),
                                       cfg->restart);
  consumers.start({std::string(TOPIC_MOVIE), std::string(TOPIC_USER), std::string(TOPIC_PAYMENT)});

  const events::IngestEndpoint movie(events::EventKind::Movie, **publisher);
  const events::IngestEndpoint user(events::EventKind::User, **publisher);
  const events::IngestEndpoint payment(events::EventKind::Payment, **publisher);

  restbed::Service service;
  service.publish(ingest_resource(PIPELINE_MOVIE_PATH, movie));
  service.publish(ingest_resource(PIPELINE_USER_PATH, user));
  service.publish(ingest_resource(PIPELINE_PAYMENT_PATH, payment));
  service.publish(net::make_resource(std::string(PIPELINE_HEALTH_PATH),
                                     [](const proxy::HttpRequest&) { return events::IngestEndpoint::health(); }));
  service.set_method_not_allowed_handler([](const std::shared_ptr<restbed::Session> session) {
    net::reply(session, proxy::text_response(proxy::status::MethodNotAllowed, "Method not allowed"));
  });
  net::install_error_handler(service);

  spdlog::info("Events service starting on port {}", cfg->port);
  spdlog::info("Connecting to Kafka brokers at {}", cfg->bootstrap);
  spdlog::info("Consumer restart on failure: {}", cfg->restart.enabled);

  int rc = EXIT_SUCCESS;
  try {
    service.start(net::make_settings(cfg->port, std::max(1u, std::thread::hardware_concurrency())));
  } catch (const std::exception& e) {
    spdlog::critical("Failed to start server: {}", e.what());
    rc = EXIT_FAILURE;
    consumers.request_stop();
  }

  consumers.wait();
  return rc;
}
