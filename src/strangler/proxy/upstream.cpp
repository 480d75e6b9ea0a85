/**
 * @file upstream.cpp
 * @brief Reverse-proxy header rules shared by all Upstream implementations.
 */
#include "strangler/proxy/upstream.hpp"

#include <array>

namespace strangler::proxy {

namespace {

constexpr std::array<std::string_view, 9> HopByHop{
    "Connection", "Keep-Alive", "Proxy-Authenticate", "Proxy-Authorization",
    "Proxy-Connection", "TE", "Trailer", "Transfer-Encoding", "Upgrade"
};

constexpr std::string_view ForwardedFor = "X-Forwarded-For";

} // namespace

bool is_hop_by_hop(std::string_view name) noexcept {
    for (auto h : HopByHop) {
        if (iequals(h, name)) return true;
    }
    return false;
}

Headers outbound_headers(const HttpRequest& req) {
    Headers out;
    std::string prior_xff;
    for (const auto& [k, v] : req.headers) {
        if (is_hop_by_hop(k) || iequals(k, "Host") || iequals(k, "Content-Length")) continue;
        if (iequals(k, ForwardedFor)) {
            if (!prior_xff.empty()) prior_xff += ", ";
            prior_xff += v;
            continue;
        }
        out.emplace(k, v);
    }
    if (!req.client_ip.empty()) {
        out.emplace(std::string(ForwardedFor),
                    prior_xff.empty() ? req.client_ip : prior_xff + ", " + req.client_ip);
    } else if (!prior_xff.empty()) {
        out.emplace(std::string(ForwardedFor), prior_xff);
    }
    return out;
}

Headers inbound_headers(const Headers& upstream, std::string_view method) {
    const bool keep_length = method == "HEAD";
    Headers out;
    for (const auto& [k, v] : upstream) {
        if (is_hop_by_hop(k) || (!keep_length && iequals(k, "Content-Length"))) continue;
        out.emplace(k, v);
    }
    return out;
}

} // namespace strangler::proxy
