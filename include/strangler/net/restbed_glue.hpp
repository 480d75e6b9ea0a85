#pragma once
/**
 * @file restbed_glue.hpp
 * @brief Conversions between restbed sessions and proxy::HttpRequest/HttpResponse.
 * @details Both services keep their request logic transport-neutral; this is
 *          the only code that sees restbed types.
 */

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <restbed>

#include "strangler/compat/expected.hpp"
#include "strangler/net/offload.hpp"
#include "strangler/proxy/http_types.hpp"
#include "strangler/proxy/upstream_url.hpp"

namespace strangler::net {

/// Methods registered on fixed resources so every verb reaches our handler.
const std::vector<std::string>& all_methods();

/// Handler over a fully read request.
using RequestHandler = std::function<proxy::HttpResponse(const proxy::HttpRequest&)>;

/// Peer address from restbed's "address:port" origin; IPv6 brackets removed.
std::string client_address(std::string_view origin);

/**
 * @brief Convert a restbed request and its body.
 * @details restbed decodes the path and the query parameters. The path is kept
 *          decoded (the forwarder re-encodes it); the parameters are re-encoded
 *          into raw_query in restbed's order (by name, repeats in arrival order).
 */
strangler_detail::expected<proxy::HttpRequest, proxy::UrlError>
to_request(const restbed::Request& request, const restbed::Bytes& body, std::string_view origin);

/**
 * @brief Read the body (Content-Length bytes), convert, run @p handler, close the session.
 * @param offload When set, @p handler runs on an Offload thread instead of the
 *        restbed worker; use it for handlers that block on I/O.
 * @details Exceptions from @p handler are logged and answered with 500.
 */
void serve(const std::shared_ptr<restbed::Session>& session, const RequestHandler& handler,
           Offload* offload = nullptr);

/// Headers sent with @p resp: its own, plus Content-Length from the body unless already set.
proxy::Headers response_headers(const proxy::HttpResponse& resp);

/// Send @p resp and close.
void reply(const std::shared_ptr<restbed::Session>& session, const proxy::HttpResponse& resp);

/// Build a resource answering every verb on @p path with @p handler.
std::shared_ptr<restbed::Resource> make_resource(const std::string& path, RequestHandler handler);

/// Server settings shared by both services.
std::shared_ptr<restbed::Settings> make_settings(uint16_t port, unsigned workers);

/// Log restbed-level errors through spdlog instead of restbed's stderr logger.
void install_error_handler(restbed::Service& service);

} // namespace strangler::net
