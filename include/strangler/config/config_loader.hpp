#pragma once
/**
 * @file config_loader.hpp
 * @brief Environment-driven configuration for both services.
 * @details Resolved once at startup; every default comes from constants.hpp.
 *          The environment lookup is injectable so tests never touch setenv().
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "strangler/compat/expected.hpp"
#include "strangler/events/consumer_loop.hpp"
#include "strangler/proxy/upstream_url.hpp"
#include "strangler/routing/migration_router.hpp"

namespace strangler::config {

    /** @struct ConfigError
     *  @brief A setting that prevents the process from starting.
     */
    struct ConfigError {
        std::string key;    ///< Environment variable at fault
        std::string detail; ///< What was wrong with it
    };

    /** @struct GatewayConfig
     *  @brief Everything the gateway needs; immutable after load.
     */
    struct GatewayConfig {
        uint16_t                   port{};
        proxy::UpstreamUrl         monolith;
        proxy::UpstreamUrl         movies;
        proxy::UpstreamUrl         events;
        routing::MigrationConfig   migration;
        unsigned                   workers{1};
        std::string                log_level;
    };

    /** @struct PipelineConfig
     *  @brief Event pipeline settings.
     */
    struct PipelineConfig {
        uint16_t                   port{};
        std::vector<std::string>   brokers;      ///< host:port entries, trimmed, blanks dropped
        std::string                brokers_text; ///< As configured, for logs
        std::string                bootstrap;    ///< brokers joined with ',', handed to librdkafka
        std::string                group_id;
        events::RestartPolicy      restart;
        std::string                log_level;
    };

    /// Returns the value of an environment variable if it is set (even if empty).
    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    /** @class Loader
     *  @brief Source of service configuration.
     */
    class Loader {
    public:
        explicit Loader(EnvLookup env = process_env());

        /// Gateway settings; a malformed upstream URL or port is an error.
        strangler_detail::expected<GatewayConfig, ConfigError> gateway() const;

        /// Event pipeline settings; an empty broker list or bad port is an error.
        strangler_detail::expected<PipelineConfig, ConfigError> pipeline() const;

        /// LOG_LEVEL or the default; read before logging is set up.
        std::string log_level() const;

        /// std::getenv-backed lookup.
        static EnvLookup process_env();

        /// Split "a:1, b:2,,c:3" into {"a:1","b:2","c:3"}.
        static std::vector<std::string> split_brokers(std::string_view list);

    private:
        std::string get(std::string_view key, std::string_view fallback) const;
        strangler_detail::expected<uint16_t, ConfigError> port(std::string_view key, uint16_t fallback) const;
        strangler_detail::expected<proxy::UpstreamUrl, ConfigError> upstream(std::string_view key,
                                                                              std::string_view fallback) const;
        int migration_percent() const;

        EnvLookup env_;
    };

} // namespace strangler::config
