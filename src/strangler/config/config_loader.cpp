/**
* @file config_loader.cpp
 * @brief Environment parsing with named defaults.
 */
#include "strangler/config/config_loader.hpp"
#include "strangler/config/constants.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <thread>

#include <spdlog/spdlog.h>

namespace strangler::config {
    using namespace strangler::config::constants;
    using strangler_detail::unexpected;

    namespace {

        std::optional<long long> parse_integer(std::string_view s) {
            if (!s.empty() && s.front() == '+') s.remove_prefix(1);
            long long v = 0;
            const auto* end = s.data() + s.size();
            const auto [ptr, ec] = std::from_chars(s.data(), end, v);
            if (s.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
            return v;
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
            return s;
        }

    } // namespace

    Loader::Loader(EnvLookup env) : env_(std::move(env)) {}

    EnvLookup Loader::process_env() {
        return [](std::string_view key) -> std::optional<std::string> {
            const std::string k(key);
            if (const char* v = std::getenv(k.c_str())) return std::string(v);
            return std::nullopt;
        };
    }

    std::string Loader::get(std::string_view key, std::string_view fallback) const {
        if (env_) {
            if (auto v = env_(key)) return *v;
        }
        return std::string(fallback);
    }

    std::string Loader::log_level() const {
        return get("LOG_LEVEL", LOG_DEFAULT_LEVEL);
    }

    strangler_detail::expected<uint16_t, ConfigError>
    Loader::port(std::string_view key, uint16_t fallback) const {
        const std::string raw = get(key, std::to_string(fallback));
        const auto v = parse_integer(raw);
        if (!v || *v < 1 || *v > 65535) {
            return unexpected(ConfigError{std::string(key), "invalid port '" + raw + "'"});
        }
        return static_cast<uint16_t>(*v);
    }

    strangler_detail::expected<proxy::UpstreamUrl, ConfigError>
    Loader::upstream(std::string_view key, std::string_view fallback) const {
        auto parsed = proxy::parse_upstream_url(get(key, fallback));
        if (!parsed) return unexpected(ConfigError{std::string(key), parsed.error().detail});
        return std::move(*parsed);
    }

    int Loader::migration_percent() const {
        const std::string raw = get("MOVIES_MIGRATION_PERCENT", std::to_string(GATEWAY_DEFAULT_MIGRATION_PCT));
        const auto v = parse_integer(raw);
        if (!v) {
            spdlog::warn("Invalid MOVIES_MIGRATION_PERCENT value '{}', defaulting to {}",
                         raw, GATEWAY_DEFAULT_MIGRATION_PCT);
            return GATEWAY_DEFAULT_MIGRATION_PCT;
        }
        const auto clamped = std::clamp<long long>(*v, MIGRATION_PCT_MIN, MIGRATION_PCT_MAX);
        if (clamped != *v) {
            spdlog::warn("MOVIES_MIGRATION_PERCENT {} outside [{}, {}], using {}",
                         *v, MIGRATION_PCT_MIN, MIGRATION_PCT_MAX, clamped);
        }
        return static_cast<int>(clamped);
    }

    std::vector<std::string> Loader::split_brokers(std::string_view list) {
        std::vector<std::string> out;
        while (!list.empty()) {
            const auto comma = list.find(',');
            const auto item = trim(list.substr(0, comma));
            if (!item.empty()) out.emplace_back(item);
            if (comma == std::string_view::npos) break;
            list.remove_prefix(comma + 1);
        }
        return out;
    }

    strangler_detail::expected<GatewayConfig, ConfigError> Loader::gateway() const {
        GatewayConfig gc;

        auto p = port("PORT", GATEWAY_DEFAULT_PORT);
        if (!p) return unexpected(p.error());
        gc.port = *p;

        auto mono = upstream("MONOLITH_URL", GATEWAY_DEFAULT_MONOLITH_URL);
        if (!mono) return unexpected(mono.error());
        auto mov = upstream("MOVIES_SERVICE_URL", GATEWAY_DEFAULT_MOVIES_URL);
        if (!mov) return unexpected(mov.error());
        auto evt = upstream("EVENTS_SERVICE_URL", GATEWAY_DEFAULT_EVENTS_URL);
        if (!evt) return unexpected(evt.error());
        gc.monolith = std::move(*mono);
        gc.movies   = std::move(*mov);
        gc.events   = std::move(*evt);

        gc.migration.enabled = get("GRADUAL_MIGRATION", GATEWAY_DEFAULT_MIGRATION ? "true" : "false") == "true";
        gc.migration.percent = migration_percent();

        const unsigned hw = std::thread::hardware_concurrency();
        gc.workers = hw > 0 ? hw : 1;
        if (auto w = env_ ? env_("GATEWAY_WORKERS") : std::nullopt) {
            const auto v = parse_integer(*w);
            if (!v || *v < 1) {
                return unexpected(ConfigError{"GATEWAY_WORKERS", "invalid worker count '" + *w + "'"});
            }
            gc.workers = static_cast<unsigned>(*v);
        }

        gc.log_level = log_level();
        return gc;
    }

    strangler_detail::expected<PipelineConfig, ConfigError> Loader::pipeline() const {
        PipelineConfig pc;

        auto p = port("PORT", PIPELINE_DEFAULT_PORT);
        if (!p) return unexpected(p.error());
        pc.port = *p;

        pc.brokers_text = get("KAFKA_BROKERS", PIPELINE_DEFAULT_BROKERS);
        pc.brokers = split_brokers(pc.brokers_text);
        if (pc.brokers.empty()) {
            return unexpected(ConfigError{"KAFKA_BROKERS", "no broker addresses in '" + pc.brokers_text + "'"});
        }
        for (const auto& b : pc.brokers) {
            if (!pc.bootstrap.empty()) pc.bootstrap.push_back(',');
            pc.bootstrap += b;
        }

        pc.group_id = std::string(CONSUMER_GROUP_ID);

        pc.restart.enabled = get("CONSUMER_RESTART", CONSUMER_DEFAULT_RESTART ? "true" : "false") == "true";
        const std::string backoff = get("CONSUMER_RESTART_BACKOFF_MS", std::to_string(CONSUMER_RESTART_BACKOFF_MS));
        const auto b = parse_integer(backoff);
        if (!b || *b < 1) {
            return unexpected(ConfigError{"CONSUMER_RESTART_BACKOFF_MS", "invalid backoff '" + backoff + "'"});
        }
        pc.restart.backoff_ms = static_cast<uint32_t>(std::min<long long>(*b, CONSUMER_RESTART_MAX_BACKOFF_MS));
        pc.restart.max_backoff_ms = CONSUMER_RESTART_MAX_BACKOFF_MS;

        pc.log_level = log_level();
        return pc;
    }

} // namespace strangler::config
