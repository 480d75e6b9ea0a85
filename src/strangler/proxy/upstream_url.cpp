/**
 * @file upstream_url.cpp
 * @brief CURLU-based origin parsing and URL joining.
 */
#include "strangler/proxy/upstream_url.hpp"

#include <memory>
#include <string>

#include <curl/curl.h>

namespace strangler::proxy {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* u) const noexcept { curl_url_cleanup(u); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

/// Read one URL part; missing optional parts yield an empty string.
std::string url_part(CURLU* u, CURLUPart part) {
    char* out = nullptr;
    if (curl_url_get(u, part, &out, 0) != CURLUE_OK || out == nullptr) return {};
    std::string s(out);
    curl_free(out);
    return s;
}

} // namespace

std::string UpstreamUrl::authority() const {
    return port.empty() ? host : host + ":" + port;
}

strangler_detail::expected<UpstreamUrl, UrlError> parse_upstream_url(std::string_view text) {
    using strangler_detail::unexpected;

    if (text.empty()) return unexpected(UrlError{"empty URL"});

    CurlUrlPtr u(curl_url());
    if (!u) return unexpected(UrlError{"out of memory"});

    const std::string owned(text);
    const CURLUcode rc = curl_url_set(u.get(), CURLUPART_URL, owned.c_str(), 0);
    if (rc != CURLUE_OK) {
        return unexpected(UrlError{"invalid URL '" + owned + "' (CURLUcode " + std::to_string(static_cast<int>(rc)) + ")"});
    }

    UpstreamUrl out;
    out.text       = owned;
    out.scheme     = url_part(u.get(), CURLUPART_SCHEME);
    out.host       = url_part(u.get(), CURLUPART_HOST);
    out.port       = url_part(u.get(), CURLUPART_PORT);
    out.base_path  = url_part(u.get(), CURLUPART_PATH);
    out.base_query = url_part(u.get(), CURLUPART_QUERY);

    if (out.scheme != "http" && out.scheme != "https") {
        return unexpected(UrlError{"unsupported scheme '" + out.scheme + "' in '" + owned + "'"});
    }
    if (out.host.empty()) {
        return unexpected(UrlError{"missing host in '" + owned + "'"});
    }
    if (out.base_path.empty()) out.base_path = "/";
    return out;
}

std::string join_paths(std::string_view base, std::string_view path) {
    const bool base_slash = !base.empty() && base.back() == '/';
    const bool path_slash = !path.empty() && path.front() == '/';
    std::string out(base);
    if (base_slash && path_slash) {
        out.append(path.substr(1));
    } else if (!base_slash && !path_slash) {
        out.push_back('/');
        out.append(path);
    } else {
        out.append(path);
    }
    return out;
}

strangler_detail::expected<std::string, UrlError> encode_path(std::string_view decoded) {
    using strangler_detail::unexpected;

    if (decoded.empty()) return std::string();

    CurlUrlPtr u(curl_url());
    if (!u) return unexpected(UrlError{"out of memory"});

    const std::string owned(decoded);
    const CURLUcode rc = curl_url_set(u.get(), CURLUPART_PATH, owned.c_str(), CURLU_URLENCODE);
    if (rc != CURLUE_OK) {
        return unexpected(UrlError{"cannot encode path (CURLUcode " + std::to_string(static_cast<int>(rc)) + ")"});
    }
    return url_part(u.get(), CURLUPART_PATH);
}

strangler_detail::expected<std::string, UrlError> encode_query(const QueryParams& params) {
    using strangler_detail::unexpected;

    if (params.empty()) return std::string();

    CurlUrlPtr u(curl_url());
    if (!u) return unexpected(UrlError{"out of memory"});

    for (const auto& [name, value] : params) {
        // With CURLU_APPENDQUERY the first '=' is kept and the rest is escaped.
        const std::string pair = value.empty() ? name : name + "=" + value;
        const CURLUcode rc = curl_url_set(u.get(), CURLUPART_QUERY, pair.c_str(),
                                          CURLU_APPENDQUERY | CURLU_URLENCODE);
        if (rc != CURLUE_OK) {
            return unexpected(UrlError{"cannot encode query parameter '" + name + "' (CURLUcode " +
                                       std::to_string(static_cast<int>(rc)) + ")"});
        }
    }
    return url_part(u.get(), CURLUPART_QUERY);
}

strangler_detail::expected<std::string, UrlError>
target_url(const UpstreamUrl& base, std::string_view path, std::string_view raw_query) {
    auto encoded = encode_path(path);
    if (!encoded) return strangler_detail::unexpected(encoded.error());

    std::string url = base.scheme + "://" + base.authority() + join_paths(base.base_path, *encoded);

    std::string query = base.base_query;
    if (!query.empty() && !raw_query.empty()) query.push_back('&');
    query.append(raw_query);

    if (!query.empty()) {
        url.push_back('?');
        url.append(query);
    }
    return url;
}

} // namespace strangler::proxy
