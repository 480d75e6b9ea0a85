/**
 * @file http_types.hpp
 * @brief Transport-neutral request/response values passed between the HTTP
 *        server glue and the gateway / ingest logic.
 */
#pragma once

#include <map>
#include <string>
#include <string_view>

namespace strangler::proxy {

/// Header multimap; same shape restbed uses so conversion is a copy.
using Headers = std::multimap<std::string, std::string>;

/// HTTP status codes used by the services.
namespace status {
inline constexpr int Ok                  = 200;
inline constexpr int Created             = 201;
inline constexpr int BadRequest          = 400;
inline constexpr int MethodNotAllowed    = 405;
inline constexpr int InternalServerError = 500;
inline constexpr int BadGateway          = 502;
inline constexpr int ServiceUnavailable  = 503;
} // namespace status

/**
 * @brief Inbound request as seen by the gateway.
 */
struct HttpRequest {
  std::string method;       ///< e.g. "GET"
  std::string path;         ///< Decoded path without query; encoded again when forwarded
  std::string raw_query;    ///< Query string without '?', already encoded
  Headers     headers;      ///< Request headers as received
  std::string body;         ///< Full request body
  std::string client_ip;    ///< Peer address, empty if unknown
};

/**
 * @brief Response returned to the client.
 */
struct HttpResponse {
  int         status{status::Ok};
  Headers     headers;
  std::string body;
};

/// ASCII case-insensitive equality for header names.
bool iequals(std::string_view a, std::string_view b) noexcept;

/// First value of header @p name (case-insensitive), or empty.
std::string header_value(const Headers& h, std::string_view name);

/// Plain-text response with Content-Type set.
HttpResponse text_response(int status, std::string body);

/// JSON response with Content-Type set.
HttpResponse json_response(int status, std::string body);

} // namespace strangler::proxy
