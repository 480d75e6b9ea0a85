#pragma once
/**
 * @file curl_upstream.hpp
 * @brief libcurl-backed Upstream: one easy handle per forwarded request.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "strangler/proxy/upstream.hpp"
#include "strangler/proxy/upstream_url.hpp"

namespace strangler::proxy {

/** @class CurlGlobal
 *  @brief RAII for curl_global_init/cleanup. Create once in main before any thread.
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&)            = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const noexcept { return ok_; }

private:
    bool ok_{false};
};

/** @struct CurlRequestPlan
 *  @brief What CurlUpstream hands to libcurl for one forward.
 */
struct CurlRequestPlan {
    enum class Mode : uint8_t {
        Get,    ///< CURLOPT_HTTPGET
        Head,   ///< CURLOPT_NOBODY
        Custom  ///< CURLOPT_CUSTOMREQUEST with the client's verb
    };

    std::string              url;
    Mode                     mode{Mode::Get};
    bool                     send_body{false};
    std::vector<std::string> header_lines;  ///< CURLOPT_HTTPHEADER entries
};

/**
 * @brief Map a client request onto libcurl options.
 * @details Header lines suppress libcurl's own "Expect" (and "Accept" when the
 *          client sent none); an empty header value is spelled "Name;".
 * @return Plan, or ForwardError when the target URL cannot be encoded.
 */
strangler_detail::expected<CurlRequestPlan, ForwardError> plan_request(const UpstreamUrl& base,
                                                                       const HttpRequest& req);

/** @class CurlUpstream
 *  @brief Forwards method, path, query, filtered headers and body verbatim.
 *  @note No retries. Only the connect phase is bounded (GATEWAY_CONNECT_TIMEOUT_MS).
 */
class CurlUpstream final : public Upstream {
public:
    explicit CurlUpstream(UpstreamUrl base) : base_(std::move(base)) {}

    strangler_detail::expected<HttpResponse, ForwardError> forward(const HttpRequest& req) override;

    std::string describe() const override { return base_.text; }

    const UpstreamUrl& base() const noexcept { return base_; }

private:
    UpstreamUrl base_;
};

} // namespace strangler::proxy
