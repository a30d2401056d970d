#pragma once

/**
 * @file config.hpp
 * @brief Engine, retry and binder configuration
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "streamiq/cluster/host_info.hpp"

namespace streamiq {

/**
 * @brief Flat key=value property set
 */
using Properties = std::map<std::string, std::string>;

constexpr const char* DEFAULT_BOOTSTRAP_SERVERS = "localhost:9092";

/**
 * @brief Configuration of one engine instance
 */
struct StreamsConfig {
    std::string application_id;
    std::string bootstrap_servers{DEFAULT_BOOTSTRAP_SERVERS};
    std::optional<HostInfo> application_server;
    std::uint32_t num_stream_threads{1};
    int num_partitions{1};

    /**
     * @brief Read application.id, bootstrap.servers, application.server,
     * num.stream.threads and num.partitions; other keys are ignored
     * @throws ConfigError on malformed values
     */
    static StreamsConfig from_properties(const Properties& props);

    /**
     * @throws ConfigError if application_id is empty or a count is not positive
     */
    void validate() const;
};

/**
 * @brief Retry policy for state store lookups
 */
struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds backoff_period{1000};
    double multiplier{1.0};
    std::chrono::milliseconds max_backoff{30000};

    /**
     * @brief Sleep before attempt + 1, for attempt >= 1
     */
    [[nodiscard]] std::chrono::milliseconds backoff_for(int attempt) const;

    /**
     * @throws ConfigError if max_attempts < 1 or an interval is negative
     */
    void validate() const;
};

/**
 * @brief Binder-level settings shared by every engine it starts
 *
 * Property keys, relative to the prefix passed to from_properties():
 *   brokers
 *   application-id
 *   state-store-retry.max-attempts
 *   state-store-retry.backoff-period       (ms)
 *   state-store-retry.multiplier
 *   state-store-retry.max-backoff          (ms)
 *   log-level
 *   configuration.<engine key>             (passed through to engines)
 */
struct BinderConfig {
    std::string brokers{DEFAULT_BOOTSTRAP_SERVERS};
    std::string application_id;
    Properties configuration;
    RetryPolicy state_store_retry;
    std::string log_level{"info"};

    static BinderConfig from_properties(
        const Properties& props,
        const std::string& prefix = "streamiq.binder."
    );

    /**
     * @brief configuration["application.server"], if set
     */
    [[nodiscard]] std::optional<std::string> application_server() const;

    /**
     * @brief Engine config derived from the binder settings
     *
     * Starts from `configuration`, applies the binder application id
     * and substitutes `brokers` for a default bootstrap.servers.
     */
    [[nodiscard]] StreamsConfig streams_config() const;
};

} // namespace streamiq
