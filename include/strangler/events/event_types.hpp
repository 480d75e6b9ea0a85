/**
 * @file event_types.hpp
 * @brief Domain events accepted by the ingestion endpoints.
 *
 * Events are transient: decoded from a request body, re-serialized, handed to
 * the broker and dropped. Field values are not range-checked (negative
 * amounts, empty titles and free-form actions are all accepted).
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace strangler::events {

/// RFC 3339 rendering of the zero time, used when a timestamp is absent.
inline constexpr std::string_view ZeroTimestamp = "0001-01-01T00:00:00Z";

/**
 * @brief Event kinds; each owns one endpoint and one topic.
 */
enum class EventKind : std::uint8_t {
  Movie = 0,
  User = 1,
  Payment = 2
};

struct MovieEvent final {
  std::int64_t movie_id{0};
  std::string  title;
  std::string  action;
  std::int64_t user_id{0};

  bool operator==(const MovieEvent&) const = default;
};

/// @note timestamp is set by the caller, never by this service.
struct UserEvent final {
  std::int64_t user_id{0};
  std::string  username;
  std::string  action;
  std::string  timestamp{ZeroTimestamp};

  bool operator==(const UserEvent&) const = default;
};

struct PaymentEvent final {
  std::int64_t payment_id{0};
  std::int64_t user_id{0};
  double       amount{0.0};
  std::string  status;
  std::string  timestamp{ZeroTimestamp};

  bool operator==(const PaymentEvent&) const = default;
};

/// Broker topic for a kind ("movie-events", ...).
std::string_view topic_for(EventKind kind) noexcept;

/// Short label ("movie", "user", "payment").
std::string_view to_string(EventKind kind) noexcept;

} // namespace strangler::events
