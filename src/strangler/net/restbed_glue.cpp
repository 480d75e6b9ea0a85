/**
 * @file restbed_glue.cpp
 * @brief restbed session adapters.
 */
#include "strangler/net/restbed_glue.hpp"

#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace strangler::net {

const std::vector<std::string>& all_methods() {
    static const std::vector<std::string> methods{
        "GET", "HEAD", "POST", "PUT", "PATCH", "DELETE", "OPTIONS"
    };
    return methods;
}

std::string client_address(std::string_view origin) {
    const auto colon = origin.rfind(':');
    if (colon != std::string_view::npos) origin = origin.substr(0, colon);
    if (origin.size() >= 2 && origin.front() == '[' && origin.back() == ']') {
        origin = origin.substr(1, origin.size() - 2);
    }
    return std::string(origin);
}

strangler_detail::expected<proxy::HttpRequest, proxy::UrlError>
to_request(const restbed::Request& request, const restbed::Bytes& body, std::string_view origin) {
    proxy::QueryParams params;
    for (const auto& [name, value] : request.get_query_parameters()) params.emplace_back(name, value);
    auto query = proxy::encode_query(params);
    if (!query) return strangler_detail::unexpected(query.error());

    proxy::HttpRequest out;
    out.method    = request.get_method();
    out.path      = request.get_path();
    out.raw_query = std::move(*query);
    for (const auto& [k, v] : request.get_headers()) out.headers.emplace(k, v);
    out.body.assign(body.begin(), body.end());
    out.client_ip = client_address(origin);
    return out;
}

proxy::Headers response_headers(const proxy::HttpResponse& resp) {
    auto headers = resp.headers;
    if (proxy::header_value(headers, "Content-Length").empty()) {
        headers.emplace("Content-Length", std::to_string(resp.body.size()));
    }
    return headers;
}

void reply(const std::shared_ptr<restbed::Session>& session, const proxy::HttpResponse& resp) {
    session->close(resp.status, resp.body, response_headers(resp));
}

void serve(const std::shared_ptr<restbed::Session>& session, const RequestHandler& handler, Offload* offload) {
    const auto request = session->get_request();
    const std::size_t length = request->get_header("Content-Length", std::size_t{0});

    auto respond = [handler](const std::shared_ptr<restbed::Session>& s, const restbed::Bytes& body) {
        proxy::HttpResponse resp;
        try {
            auto req = to_request(*s->get_request(), body, s->get_origin());
            if (req) {
                resp = handler(*req);
            } else {
                spdlog::error("Cannot convert request for {}: {}", s->get_request()->get_path(), req.error().detail);
                resp = proxy::text_response(proxy::status::InternalServerError, "Internal Server Error");
            }
        } catch (const std::exception& e) {
            spdlog::error("Unhandled error serving {}: {}", s->get_request()->get_path(), e.what());
            resp = proxy::text_response(proxy::status::InternalServerError, "Internal Server Error");
        }
        reply(s, resp);
    };

    session->fetch(length, [respond, offload](const std::shared_ptr<restbed::Session> s, const restbed::Bytes& body) {
        if (offload == nullptr) {
            respond(s, body);
            return;
        }
        if (!offload->submit([respond, s, body] { respond(s, body); })) {
            reply(s, proxy::text_response(proxy::status::ServiceUnavailable, "Service Unavailable"));
        }
    });
}

std::shared_ptr<restbed::Resource> make_resource(const std::string& path, RequestHandler handler) {
    auto resource = std::make_shared<restbed::Resource>();
    resource->set_path(path);
    for (const auto& m : all_methods()) {
        resource->set_method_handler(m, [handler](const std::shared_ptr<restbed::Session> session) {
            serve(session, handler);
        });
    }
    return resource;
}

std::shared_ptr<restbed::Settings> make_settings(uint16_t port, unsigned workers) {
    auto settings = std::make_shared<restbed::Settings>();
    settings->set_port(port);
    settings->set_worker_limit(workers);
    return settings;
}

void install_error_handler(restbed::Service& service) {
    service.set_error_handler([](const int status, const std::exception& error,
                                 const std::shared_ptr<restbed::Session> session) {
        spdlog::error("HTTP server error {}: {}", status, error.what());
        if (session && session->is_open()) {
            proxy::HttpResponse resp;
            resp.status = status;
            reply(session, resp);
        }
    });
}

} // namespace strangler::net
