/**
 * @file test_gateway.cpp
 * @brief Tests for Gateway dispatch, health and reverse-proxy helpers.
 *
 * Upstreams are in-process fakes; no sockets are opened.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <mutex>
#include <string>
#include <vector>

#include "strangler/config/constants.hpp"
#include "strangler/net/offload.hpp"
#include "strangler/obs/observability.hpp"
#include "strangler/proxy/curl_upstream.hpp"
#include "strangler/proxy/gateway.hpp"
#include "strangler/proxy/upstream.hpp"
#include "strangler/proxy/upstream_url.hpp"
#include "strangler/routing/migration_router.hpp"

using namespace strangler;
using proxy::HttpRequest;
using proxy::HttpResponse;
using routing::Origin;

namespace {

/// Records every forwarded request; answers with a fixed response or a failure.
class FakeUpstream final : public proxy::Upstream {
public:
  explicit FakeUpstream(std::string name, bool fail = false) : name_(std::move(name)), fail_(fail) {}

  strangler_detail::expected<HttpResponse, proxy::ForwardError> forward(const HttpRequest& req) override {
    std::lock_guard<std::mutex> lk(mu_);
    seen.push_back(req);
    if (fail_) return strangler_detail::unexpected(proxy::ForwardError{"connection refused"});
    HttpResponse r;
    r.status = 200;
    r.headers.emplace("X-Origin", name_);
    r.body = name_ + ":" + req.path;
    return r;
  }
  std::string describe() const override { return name_; }

  std::vector<HttpRequest> seen;
private:
  std::mutex  mu_;
  std::string name_;
  bool        fail_;
};

class FixedSource final : public routing::RandomSource {
public:
  explicit FixedSource(int v) : v_(v) {}
  int roll(int) override { return v_; }
private:
  int v_;
};

struct Fixture {
  explicit Fixture(routing::MigrationConfig mc, int roll = 0, bool fail = false)
      : rng(roll), router(mc, rng) {
    mono   = std::make_shared<FakeUpstream>("monolith", fail);
    movies = std::make_shared<FakeUpstream>("movies", fail);
    events = std::make_shared<FakeUpstream>("events", fail);
    proxy::UpstreamSet set;
    set[routing::index_of(Origin::Monolith)]      = mono;
    set[routing::index_of(Origin::MoviesService)] = movies;
    set[routing::index_of(Origin::EventsService)] = events;
    gateway = std::make_unique<proxy::Gateway>(router, set, observer);
  }

  FixedSource                     rng;
  routing::MigrationRouter        router;
  obs::LoggingObserver            observer;
  std::shared_ptr<FakeUpstream>   mono, movies, events;
  std::unique_ptr<proxy::Gateway> gateway;
};

HttpRequest get(std::string path) {
  HttpRequest r;
  r.method = "GET";
  r.path = std::move(path);
  return r;
}

/// libcurl's hex case differs between versions.
std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

// ---------- Health ----------

/**
 * @test Health_IndependentOfUpstreams
 * @brief /health answers 200 with the fixed body even when every origin fails.
 */
TEST(Gateway, Health_IndependentOfUpstreams) {
  Fixture f({.enabled = true, .percent = 50}, 0, /*fail=*/true);
  for (const char* m : {"GET", "HEAD", "POST"}) {
    auto req = get("/health");
    req.method = m;
    const auto resp = f.gateway->handle(req);
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, std::string(config::constants::GATEWAY_HEALTH_BODY));
  }
  EXPECT_TRUE(f.mono->seen.empty());
  EXPECT_TRUE(f.movies->seen.empty());
  EXPECT_TRUE(f.events->seen.empty());
  EXPECT_EQ(f.observer.snapshot().decisions, 0u);
}

TEST(Gateway, HealthSubpath_IsForwarded) {
  Fixture f({});
  const auto resp = f.gateway->handle(get("/health/db"));
  EXPECT_EQ(resp.body, "monolith:/health/db");
}

// ---------- Dispatch ----------

TEST(Gateway, Movies_Migrated_ToMoviesService) {
  Fixture f({.enabled = true, .percent = 60}, /*roll=*/59);
  const auto resp = f.gateway->handle(get("/api/movies/42"));
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body, "movies:/api/movies/42");
  ASSERT_EQ(f.movies->seen.size(), 1u);
  EXPECT_TRUE(f.mono->seen.empty());
}

TEST(Gateway, Movies_NotMigrated_ToMonolith) {
  Fixture f({.enabled = true, .percent = 60}, /*roll=*/60);
  EXPECT_EQ(f.gateway->handle(get("/api/movies")).body, "monolith:/api/movies");
  EXPECT_TRUE(f.movies->seen.empty());
}

TEST(Gateway, Events_ToEventsService) {
  Fixture f({.enabled = true, .percent = 100});
  EXPECT_EQ(f.gateway->handle(get("/api/events/movie")).body, "events:/api/events/movie");
}

TEST(Gateway, Default_ToMonolith) {
  Fixture f({.enabled = true, .percent = 100});
  EXPECT_EQ(f.gateway->handle(get("/api/users/1")).body, "monolith:/api/users/1");
}

/**
 * @test Forward_IsVerbatim
 * @brief Method, body, query and headers reach the origin unchanged.
 */
TEST(Gateway, Forward_IsVerbatim) {
  Fixture f({});
  HttpRequest req;
  req.method = "PUT";
  req.path = "/api/users/7";
  req.raw_query = "a=1&b=two";
  req.body = R"({"name":"x"})";
  req.headers.emplace("Content-Type", "application/json");
  req.headers.emplace("Authorization", "Bearer t");
  (void)f.gateway->handle(req);

  ASSERT_EQ(f.mono->seen.size(), 1u);
  const auto& seen = f.mono->seen.front();
  EXPECT_EQ(seen.method, "PUT");
  EXPECT_EQ(seen.path, "/api/users/7");
  EXPECT_EQ(seen.raw_query, "a=1&b=two");
  EXPECT_EQ(seen.body, req.body);
  EXPECT_EQ(proxy::header_value(seen.headers, "authorization"), "Bearer t");
}

/**
 * @test UpstreamFailure_Is502
 * @brief Unreachable origin maps to 502, is counted, and does not throw.
 */
TEST(Gateway, UpstreamFailure_Is502) {
  Fixture f({}, 0, /*fail=*/true);
  const auto resp = f.gateway->handle(get("/anything"));
  EXPECT_EQ(resp.status, 502);
  EXPECT_TRUE(resp.body.empty());
  EXPECT_EQ(f.observer.snapshot().failures_for(Origin::Monolith), 1u);

  // Still serving afterwards.
  EXPECT_EQ(f.gateway->handle(get("/health")).status, 200);
}

TEST(Gateway, MissingUpstream_Rejected) {
  FixedSource rng(0);
  routing::MigrationRouter router({}, rng);
  obs::LoggingObserver observer;
  proxy::UpstreamSet set;
  set[0] = std::make_shared<FakeUpstream>("m");
  EXPECT_THROW({ proxy::Gateway gw(router, set, observer); }, std::invalid_argument);
}

// ---------- URL handling ----------

TEST(UpstreamUrl, Parse_Valid) {
  auto u = proxy::parse_upstream_url("http://movies-service:8081");
  ASSERT_TRUE(u) << u.error().detail;
  EXPECT_EQ(u->scheme, "http");
  EXPECT_EQ(u->host, "movies-service");
  EXPECT_EQ(u->port, "8081");
  EXPECT_EQ(u->base_path, "/");
  EXPECT_EQ(u->authority(), "movies-service:8081");
}

TEST(UpstreamUrl, Parse_Invalid) {
  EXPECT_FALSE(proxy::parse_upstream_url(""));
  EXPECT_FALSE(proxy::parse_upstream_url("movies-service"));
  EXPECT_FALSE(proxy::parse_upstream_url("gopher://host"));
  EXPECT_FALSE(proxy::parse_upstream_url("http://"));
}

TEST(UpstreamUrl, JoinPaths) {
  EXPECT_EQ(proxy::join_paths("/", "/api/movies"), "/api/movies");
  EXPECT_EQ(proxy::join_paths("/v1", "/api/movies"), "/v1/api/movies");
  EXPECT_EQ(proxy::join_paths("/v1/", "/api"), "/v1/api");
  EXPECT_EQ(proxy::join_paths("/v1", "api"), "/v1/api");
  EXPECT_EQ(proxy::join_paths("/", ""), "/");
}

TEST(UpstreamUrl, TargetUrl_MergesQuery) {
  auto base = proxy::parse_upstream_url("http://monolith:8080/base?k=v");
  ASSERT_TRUE(base);
  EXPECT_EQ(proxy::target_url(*base, "/api/x", "").value(), "http://monolith:8080/base/api/x?k=v");
  EXPECT_EQ(proxy::target_url(*base, "/api/x", "a=1").value(), "http://monolith:8080/base/api/x?k=v&a=1");

  auto plain = proxy::parse_upstream_url("http://monolith:8080");
  ASSERT_TRUE(plain);
  EXPECT_EQ(proxy::target_url(*plain, "/api/x", "a=1").value(), "http://monolith:8080/api/x?a=1");
  EXPECT_EQ(proxy::target_url(*plain, "/", "").value(), "http://monolith:8080/");
}

/**
 * @test TargetUrl_EncodesDecodedPath
 * @brief A decoded path holding '?', ' ' or '%' reaches the origin as one
 *        escaped path; only the real query follows the single '?'.
 */
TEST(UpstreamUrl, TargetUrl_EncodesDecodedPath) {
  auto base = proxy::parse_upstream_url("http://monolith:8080");
  ASSERT_TRUE(base);

  const auto url = proxy::target_url(*base, "/api/movies/a?b c", "a=0&q=1&q=2");
  ASSERT_TRUE(url) << url.error().detail;
  EXPECT_EQ(lower(*url), "http://monolith:8080/api/movies/a%3fb%20c?a=0&q=1&q=2");
  EXPECT_EQ(std::count(url->begin(), url->end(), '?'), 1);
  EXPECT_EQ(url->find(' '), std::string::npos);

  EXPECT_EQ(lower(proxy::encode_path("/api/movies/100%").value()), "/api/movies/100%25");
  EXPECT_EQ(proxy::encode_path("/api/movies/42/reviews").value(), "/api/movies/42/reviews");
  EXPECT_EQ(proxy::encode_path("").value(), "");
}

TEST(UpstreamUrl, EncodeQuery_KeepsOrderAndEscapes) {
  const proxy::QueryParams params{{"q", "a b"}, {"x", "1&2=3"}, {"q", "second"}, {"flag", ""}};
  const auto q = proxy::encode_query(params);
  ASSERT_TRUE(q) << q.error().detail;
  EXPECT_EQ(lower(*q), "q=a+b&x=1%262%3d3&q=second&flag");
  EXPECT_EQ(proxy::encode_query({}).value(), "");
}

// ---------- libcurl request mapping ----------

TEST(CurlRequestPlan, Get_HeadersAndUrl) {
  auto base = proxy::parse_upstream_url("http://movies:8081/v1");
  ASSERT_TRUE(base);
  HttpRequest req = get("/api/movies/7");
  req.raw_query = "lang=en";
  req.client_ip = "10.1.2.3";
  req.headers = {{"Host", "gateway:8000"}, {"Connection", "keep-alive"}, {"X-Trace", ""}, {"Accept", "*/*"}};

  const auto plan = proxy::plan_request(*base, req);
  ASSERT_TRUE(plan) << plan.error().detail;
  EXPECT_EQ(plan->url, "http://movies:8081/v1/api/movies/7?lang=en");
  EXPECT_EQ(plan->mode, proxy::CurlRequestPlan::Mode::Get);
  EXPECT_FALSE(plan->send_body);

  const auto& lines = plan->header_lines;
  auto has = [&](const std::string& l) { return std::find(lines.begin(), lines.end(), l) != lines.end(); };
  EXPECT_TRUE(has("Expect:"));
  EXPECT_FALSE(has("Accept:"));
  EXPECT_TRUE(has("Accept: */*"));
  EXPECT_TRUE(has("X-Trace;"));
  EXPECT_TRUE(has("X-Forwarded-For: 10.1.2.3"));
  for (const auto& l : lines) {
    EXPECT_NE(l.rfind("Host", 0), 0u) << l;
    EXPECT_NE(l.rfind("Connection", 0), 0u) << l;
  }
}

TEST(CurlRequestPlan, Methods) {
  auto base = proxy::parse_upstream_url("http://monolith:8080");
  ASSERT_TRUE(base);

  HttpRequest head = get("/x");
  head.method = "HEAD";
  EXPECT_EQ(proxy::plan_request(*base, head)->mode, proxy::CurlRequestPlan::Mode::Head);

  HttpRequest post = get("/x");
  post.method = "POST";
  const auto p = proxy::plan_request(*base, post);
  ASSERT_TRUE(p);
  EXPECT_EQ(p->mode, proxy::CurlRequestPlan::Mode::Custom);
  EXPECT_TRUE(p->send_body);  // empty POST still sends Content-Length: 0
  EXPECT_TRUE(std::find(p->header_lines.begin(), p->header_lines.end(), "Accept:") != p->header_lines.end());

  HttpRequest del = get("/x");
  del.method = "DELETE";
  EXPECT_FALSE(proxy::plan_request(*base, del)->send_body);

  HttpRequest get_with_body = get("/x");
  get_with_body.body = "{}";
  const auto g = proxy::plan_request(*base, get_with_body);
  EXPECT_EQ(g->mode, proxy::CurlRequestPlan::Mode::Custom);
  EXPECT_TRUE(g->send_body);
}

// ---------- Header rules ----------

TEST(ProxyHeaders, Outbound_DropsHopByHopAndHost) {
  HttpRequest req = get("/x");
  req.client_ip = "10.0.0.9";
  req.headers = {
    {"Host", "gateway:8000"}, {"Connection", "keep-alive"}, {"Transfer-Encoding", "chunked"},
    {"content-length", "12"}, {"Accept", "*/*"}, {"X-Trace", "abc"},
    {"X-Forwarded-For", "1.2.3.4"},
  };
  const auto out = proxy::outbound_headers(req);
  EXPECT_TRUE(proxy::header_value(out, "Host").empty());
  EXPECT_TRUE(proxy::header_value(out, "Connection").empty());
  EXPECT_TRUE(proxy::header_value(out, "Transfer-Encoding").empty());
  EXPECT_TRUE(proxy::header_value(out, "Content-Length").empty());
  EXPECT_EQ(proxy::header_value(out, "Accept"), "*/*");
  EXPECT_EQ(proxy::header_value(out, "X-Trace"), "abc");
  EXPECT_EQ(proxy::header_value(out, "X-Forwarded-For"), "1.2.3.4, 10.0.0.9");
}

TEST(ProxyHeaders, Outbound_AddsForwardedFor) {
  HttpRequest req = get("/x");
  req.client_ip = "192.0.2.1";
  EXPECT_EQ(proxy::header_value(proxy::outbound_headers(req), "X-Forwarded-For"), "192.0.2.1");
}

TEST(ProxyHeaders, Inbound_DropsFraming) {
  const proxy::Headers upstream{
    {"Content-Length", "10"}, {"Keep-Alive", "timeout=5"}, {"Content-Type", "text/html"}, {"Set-Cookie", "a=1"},
    {"Set-Cookie", "b=2"},
  };
  const auto out = proxy::inbound_headers(upstream, "GET");
  EXPECT_EQ(out.size(), 3u);
  EXPECT_EQ(out.count("Set-Cookie"), 2u);
  EXPECT_TRUE(proxy::header_value(out, "content-length").empty());
}

TEST(ProxyHeaders, Inbound_HeadKeepsLength) {
  const proxy::Headers upstream{{"Content-Length", "1234"}, {"Transfer-Encoding", "chunked"}};
  const auto out = proxy::inbound_headers(upstream, "HEAD");
  EXPECT_EQ(proxy::header_value(out, "Content-Length"), "1234");
  EXPECT_TRUE(proxy::header_value(out, "Transfer-Encoding").empty());
}

TEST(ProxyHeaders, IEquals) {
  EXPECT_TRUE(proxy::iequals("Content-Type", "content-type"));
  EXPECT_FALSE(proxy::iequals("Content-Type", "Content-Typ"));
  EXPECT_TRUE(proxy::is_hop_by_hop("upgrade"));
  EXPECT_FALSE(proxy::is_hop_by_hop("Accept"));
}

// ---------- Offloaded forwarding ----------

/**
 * @test SlowJob_DoesNotBlockOthers
 * @brief A forward stuck on an unreachable origin holds only its own thread;
 *        later requests still complete, and destruction waits for the stuck one.
 */
TEST(Offload, SlowJob_DoesNotBlockOthers) {
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::atomic<int> finished{0};

  {
    net::Offload pool;
    ASSERT_TRUE(pool.submit([gate, &finished] {
      gate.wait();
      finished.fetch_add(1);
    }));

    std::promise<void> quick_done;
    auto quick = quick_done.get_future();
    ASSERT_TRUE(pool.submit([&quick_done] { quick_done.set_value(); }));
    EXPECT_EQ(quick.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_GE(pool.in_flight(), 1u);
    EXPECT_EQ(finished.load(), 0);

    release.set_value();
    pool.drain();
    EXPECT_EQ(pool.in_flight(), 0u);
    EXPECT_EQ(finished.load(), 1);
  }
}

TEST(Offload, ThrowingJob_IsContained) {
  net::Offload pool;
  ASSERT_TRUE(pool.submit([] { throw std::runtime_error("boom"); }));
  pool.drain();
  EXPECT_EQ(pool.in_flight(), 0u);
}
