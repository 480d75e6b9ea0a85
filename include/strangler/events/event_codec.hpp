#pragma once
/**
 * @file event_codec.hpp
 * @brief JSON decoding/encoding of domain events (nlohmann::json).
 * @details Decoding is permissive about content and strict about shape:
 *          - the body must be a single JSON object;
 *          - missing or null fields keep their zero value;
 *          - unknown fields are ignored;
 *          - a field of the wrong JSON type is an error (integers reject fractions);
 *          - timestamps must be RFC 3339 strings.
 *          Encoding emits fields in declaration order.
 */

#include <string>
#include <string_view>

#include "strangler/compat/expected.hpp"
#include "strangler/events/event_types.hpp"

namespace strangler::events {

/** @struct DecodeError
 *  @brief Reason a body was rejected; returned to the client as the 400 body.
 */
struct DecodeError {
    std::string detail;
};

strangler_detail::expected<MovieEvent, DecodeError>   decode_movie(std::string_view body);
strangler_detail::expected<UserEvent, DecodeError>    decode_user(std::string_view body);
strangler_detail::expected<PaymentEvent, DecodeError> decode_payment(std::string_view body);

std::string encode(const MovieEvent& e);
std::string encode(const UserEvent& e);
std::string encode(const PaymentEvent& e);

/**
 * @brief Decode a body as @p kind and re-serialize it for the broker.
 * @return Canonical JSON payload or the decode error.
 */
strangler_detail::expected<std::string, DecodeError> reencode(EventKind kind, std::string_view body);

/// "YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)"
bool is_rfc3339(std::string_view s) noexcept;

} // namespace strangler::events
