#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the gateway and the event pipeline.
 * @details Every value here can be overridden from the environment through
 *          config::Loader, except the topic names and the consumer group.
 */

#include <cstdint>
#include <string_view>

namespace strangler::config::constants {

// =====================
// Gateway defaults
// =====================
inline constexpr uint16_t         GATEWAY_DEFAULT_PORT          = 8000;
inline constexpr std::string_view GATEWAY_DEFAULT_MONOLITH_URL  = "http://localhost:8080";
inline constexpr std::string_view GATEWAY_DEFAULT_MOVIES_URL    = "http://localhost:8081";
inline constexpr std::string_view GATEWAY_DEFAULT_EVENTS_URL    = "http://localhost:8082";
inline constexpr bool             GATEWAY_DEFAULT_MIGRATION     = false;
inline constexpr int              GATEWAY_DEFAULT_MIGRATION_PCT = 0;

/// Migration rolls are drawn uniformly from [0, MIGRATION_ROLL_RANGE).
inline constexpr int MIGRATION_ROLL_RANGE = 100;
inline constexpr int MIGRATION_PCT_MIN    = 0;
inline constexpr int MIGRATION_PCT_MAX    = 100;

/// Upstream connect timeout (the Go reverse proxy's dialer default). No total-transfer limit.
inline constexpr long GATEWAY_CONNECT_TIMEOUT_MS = 30'000;

// =====================
// Gateway paths and bodies
// =====================
inline constexpr std::string_view GATEWAY_HEALTH_PATH   = "/health";
inline constexpr std::string_view GATEWAY_HEALTH_BODY   = "Strangler Fig Proxy is healthy";
inline constexpr std::string_view MOVIES_PATH_PREFIX    = "/api/movies";
inline constexpr std::string_view EVENTS_PATH_PREFIX    = "/api/events";

// =====================
// Event pipeline defaults
// =====================
inline constexpr uint16_t         PIPELINE_DEFAULT_PORT    = 8082;
inline constexpr std::string_view PIPELINE_DEFAULT_BROKERS = "localhost:9092";

/// Shared by all three consumer loops so horizontal scaling splits partitions.
inline constexpr std::string_view CONSUMER_GROUP_ID = "cinemaabyss-events-consumer-group";

inline constexpr std::string_view TOPIC_MOVIE   = "movie-events";
inline constexpr std::string_view TOPIC_USER    = "user-events";
inline constexpr std::string_view TOPIC_PAYMENT = "payment-events";

inline constexpr std::string_view PIPELINE_MOVIE_PATH   = "/api/events/movie";
inline constexpr std::string_view PIPELINE_USER_PATH    = "/api/events/user";
inline constexpr std::string_view PIPELINE_PAYMENT_PATH = "/api/events/payment";
inline constexpr std::string_view PIPELINE_HEALTH_PATH  = "/api/events/health";

// =====================
// Broker client tuning
// =====================
inline constexpr int      CONSUMER_FETCH_MIN_BYTES   = 10'000;      ///< 10 KB
inline constexpr int      CONSUMER_FETCH_MAX_BYTES   = 10'000'000;  ///< 10 MB
inline constexpr int      CONSUMER_POLL_TIMEOUT_MS   = 500;         ///< Poll slice between stop checks
inline constexpr int      PRODUCER_MESSAGE_TIMEOUT_MS = 10'000;     ///< Delivery report deadline
inline constexpr int      PRODUCER_POLL_INTERVAL_MS  = 100;         ///< Delivery-report pump cadence
inline constexpr int      PRODUCER_FLUSH_TIMEOUT_MS  = 5'000;       ///< Flush on shutdown

// =====================
// Consumer supervision
// =====================
inline constexpr bool     CONSUMER_DEFAULT_RESTART    = false;   ///< Terminate-and-degrade by default
inline constexpr uint32_t CONSUMER_RESTART_BACKOFF_MS = 1'000;   ///< First retry delay
inline constexpr uint32_t CONSUMER_RESTART_MAX_BACKOFF_MS = 30'000;

// =====================
// Logging
// =====================
inline constexpr std::string_view LOG_DEFAULT_LEVEL = "info";
inline constexpr std::string_view LOG_PATTERN       = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

} // namespace strangler::config::constants
