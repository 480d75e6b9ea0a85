#pragma once
/**
 * @file upstream_url.hpp
 * @brief Parsed upstream base URL and request-URL joining.
 * @details Parsing goes through libcurl's URL API (CURLU) so the gateway
 *          validates origins with the same parser that later sends to them.
 */

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "strangler/compat/expected.hpp"

namespace strangler::proxy {

/** @struct UrlError
 *  @brief Why an upstream URL was rejected.
 */
struct UrlError {
    std::string detail;
};

/** @struct UpstreamUrl
 *  @brief Components of a configured origin, e.g. "http://movies:8081/base".
 */
struct UpstreamUrl {
    std::string scheme;     ///< "http" or "https"
    std::string host;       ///< Host name or literal (IPv6 with brackets)
    std::string port;       ///< Explicit port, empty when defaulted
    std::string base_path;  ///< Path prefix, "/" when none
    std::string base_query; ///< Query configured on the origin, usually empty
    std::string text;       ///< Original configured string

    /// host[:port]
    std::string authority() const;
};

/**
 * @brief Parse and validate an origin URL.
 * @return UpstreamUrl, or UrlError if the text is not an absolute http(s) URL with a host.
 */
strangler_detail::expected<UpstreamUrl, UrlError> parse_upstream_url(std::string_view text);

/**
 * @brief Join base path and request path with exactly one slash between them.
 * @details "/" + "/api/x" -> "/api/x"; "/v1" + "/api/x" -> "/v1/api/x".
 */
std::string join_paths(std::string_view base, std::string_view path);

/// Decoded query parameters, in the order they are forwarded.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Percent-encode a decoded request path for the wire.
 * @details '/' separators are kept; every other byte outside the unreserved
 *          set is escaped, so "/a?b c" becomes "/a%3fb%20c".
 */
strangler_detail::expected<std::string, UrlError> encode_path(std::string_view decoded);

/**
 * @brief Encode decoded parameters as "name=value&..." (form style, space as '+').
 * @details A parameter with an empty value is sent as the bare name.
 */
strangler_detail::expected<std::string, UrlError> encode_query(const QueryParams& params);

/**
 * @brief Full URL to forward to: base authority, joined path, merged query.
 * @param path Decoded request path; encoded here.
 * @param raw_query Query already in wire form (see encode_query).
 */
strangler_detail::expected<std::string, UrlError>
target_url(const UpstreamUrl& base, std::string_view path, std::string_view raw_query);

} // namespace strangler::proxy
