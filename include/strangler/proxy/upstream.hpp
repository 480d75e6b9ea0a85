#pragma once
/**
 * @file upstream.hpp
 * @brief Forwarding seam between the gateway and an origin.
 * @details The gateway holds one Upstream per routing::Origin. CurlUpstream is
 *          the production implementation; tests plug in recording fakes.
 */

#include <string>
#include <string_view>

#include "strangler/compat/expected.hpp"
#include "strangler/proxy/http_types.hpp"

namespace strangler::proxy {

/** @struct ForwardError
 *  @brief Transport-level failure talking to an origin (connect, DNS, I/O).
 *  @note An origin answering with 5xx is a response, not a ForwardError.
 */
struct ForwardError {
    std::string detail;
};

/** @class Upstream
 *  @brief One origin that requests can be forwarded to.
 */
class Upstream {
public:
    virtual ~Upstream() = default;

    /**
     * @brief Send @p req to the origin and wait for its full response.
     * @note Called concurrently from server worker threads.
     */
    virtual strangler_detail::expected<HttpResponse, ForwardError> forward(const HttpRequest& req) = 0;

    /// Human-readable origin for logs.
    virtual std::string describe() const = 0;
};

/// True for headers that apply to a single connection and must not be forwarded.
bool is_hop_by_hop(std::string_view name) noexcept;

/**
 * @brief Headers to send upstream.
 * @details Drops hop-by-hop, Host and Content-Length (the client library frames
 *          the body), and appends the client address to X-Forwarded-For.
 */
Headers outbound_headers(const HttpRequest& req);

/**
 * @brief Headers to return to the client from an origin response.
 * @details Drops hop-by-hop and Content-Length; the server glue reframes the body.
 *          For HEAD (@p method) the origin's Content-Length is kept, since there
 *          is no body to derive it from.
 */
Headers inbound_headers(const Headers& upstream, std::string_view method);

} // namespace strangler::proxy
