/**
 * @file event_types.cpp
 * @brief Kind-to-topic mapping.
 */
#include "strangler/events/event_types.hpp"
#include "strangler/config/constants.hpp"

namespace strangler::events {

using namespace strangler::config::constants;

std::string_view topic_for(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::Movie:   return TOPIC_MOVIE;
    case EventKind::User:    return TOPIC_USER;
    case EventKind::Payment: return TOPIC_PAYMENT;
  }
  return {};
}

std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::Movie:   return "movie";
    case EventKind::User:    return "user";
    case EventKind::Payment: return "payment";
  }
  return "unknown";
}

} // namespace strangler::events
