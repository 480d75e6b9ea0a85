/**
 * @file curl_upstream.cpp
 * @brief Blocking libcurl forward used by the gateway worker threads.
 */
#include "strangler/proxy/curl_upstream.hpp"
#include "strangler/config/constants.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <curl/curl.h>

namespace strangler::proxy {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using CurlEasyPtr  = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

size_t write_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<Headers*>(userdata);
    const std::string_view line = trim(std::string_view(buffer, size * nitems));

    // Each status line starts a new header block (1xx interim responses).
    if (line.substr(0, 5) == "HTTP/") {
        headers->clear();
        return size * nitems;
    }
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && colon > 0) {
        headers->emplace(std::string(trim(line.substr(0, colon))),
                         std::string(trim(line.substr(colon + 1))));
    }
    return size * nitems;
}

bool has_body_semantics(std::string_view method) noexcept {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

} // namespace

CurlGlobal::CurlGlobal()
    : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

strangler_detail::expected<CurlRequestPlan, ForwardError> plan_request(const UpstreamUrl& base,
                                                                       const HttpRequest& req) {
    CurlRequestPlan plan;

    auto url = target_url(base, req.path, req.raw_query);
    if (!url) return strangler_detail::unexpected(ForwardError{url.error().detail});
    plan.url = std::move(*url);

    // Suppress libcurl's own defaults so only the client's headers go out.
    plan.header_lines.emplace_back("Expect:");
    if (header_value(req.headers, "Accept").empty()) plan.header_lines.emplace_back("Accept:");
    for (const auto& [name, value] : outbound_headers(req)) {
        plan.header_lines.push_back(value.empty() ? name + ";" : name + ": " + value);
    }

    if (req.method == "GET" && req.body.empty()) {
        plan.mode = CurlRequestPlan::Mode::Get;
    } else if (req.method == "HEAD") {
        plan.mode = CurlRequestPlan::Mode::Head;
    } else {
        plan.mode      = CurlRequestPlan::Mode::Custom;
        plan.send_body = !req.body.empty() || has_body_semantics(req.method);
    }
    return plan;
}

strangler_detail::expected<HttpResponse, ForwardError>
CurlUpstream::forward(const HttpRequest& req) {
    using strangler_detail::unexpected;

    auto plan = plan_request(base_, req);
    if (!plan) return unexpected(plan.error());

    CurlEasyPtr curl(curl_easy_init());
    if (!curl) return unexpected(ForwardError{"curl_easy_init failed"});

    curl_slist* raw_list = nullptr;
    for (const auto& line : plan->header_lines) {
        curl_slist* next = curl_slist_append(raw_list, line.c_str());
        if (!next) {
            curl_slist_free_all(raw_list);
            return unexpected(ForwardError{"curl_slist_append failed"});
        }
        raw_list = next;
    }
    CurlSlistPtr header_list(raw_list);

    HttpResponse resp;
    Headers upstream_headers;
    char errbuf[CURL_ERROR_SIZE] = {0};

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, plan->url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, config::constants::GATEWAY_CONNECT_TIMEOUT_MS);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &upstream_headers);

    switch (plan->mode) {
        case CurlRequestPlan::Mode::Get:
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            break;
        case CurlRequestPlan::Mode::Head:
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
            break;
        case CurlRequestPlan::Mode::Custom:
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
            if (plan->send_body) {
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
            }
            break;
    }

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        const std::string detail = errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
        return unexpected(ForwardError{plan->url + ": " + detail});
    }

    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    resp.status  = static_cast<int>(code);
    resp.headers = inbound_headers(upstream_headers, req.method);
    return resp;
}

} // namespace strangler::proxy
