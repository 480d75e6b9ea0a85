/**
 * @file ingest_handler.cpp
 * @brief IngestEndpoint implementation.
 */
#include "strangler/events/ingest_handler.hpp"
#include "strangler/events/event_codec.hpp"

#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace strangler::events {

namespace status = proxy::status;

proxy::HttpResponse IngestEndpoint::handle(std::string_view method, std::string_view body) const {
    if (method != "POST") {
        return proxy::text_response(status::MethodNotAllowed, "Method not allowed");
    }

    auto payload = reencode(kind_, body);
    if (!payload) {
        spdlog::info("Rejected {} event: {}", to_string(kind_), payload.error().detail);
        return proxy::text_response(status::BadRequest, payload.error().detail);
    }

    const auto topic = topic_for(kind_);
    auto written = publisher_->publish(topic, *payload);
    if (!written) {
        spdlog::error("Failed to write message to Kafka: {}", written.error().detail);
        return proxy::text_response(status::InternalServerError, "Failed to write message to Kafka");
    }

    spdlog::info("Successfully produced message to topic {}: {}", topic, *payload);
    return proxy::json_response(status::Created, nlohmann::json{{"status", "success"}}.dump());
}

proxy::HttpResponse IngestEndpoint::health() {
    return proxy::json_response(status::Ok, nlohmann::json{{"status", true}}.dump());
}

} // namespace strangler::events
