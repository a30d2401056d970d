/**
 * @file config.cpp
 * @brief Property parsing for engine and binder configuration
 */

#include "streamiq/core/config.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "streamiq/core/errors.hpp"
#include "streamiq/logging.hpp"

namespace streamiq {

namespace {

const std::string* find(const Properties& props, const std::string& key) {
    auto it = props.find(key);
    return it == props.end() ? nullptr : &it->second;
}

long long parse_integer(const std::string& key, const std::string& text) {
    try {
        std::size_t consumed = 0;
        auto value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw ConfigError("Trailing characters in '" + key + "': '" + text + "'");
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ConfigError("Expected an integer for '" + key + "', got '" + text + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError("Integer out of range for '" + key + "': '" + text + "'");
    }
}

template<typename Int>
Int parse_bounded(const std::string& key, const std::string& text) {
    auto value = parse_integer(key, text);
    if (value < static_cast<long long>(std::numeric_limits<Int>::min())
        || value > static_cast<long long>(std::numeric_limits<Int>::max())) {
        throw ConfigError("Integer out of range for '" + key + "': '" + text + "'");
    }
    return static_cast<Int>(value);
}

double parse_double(const std::string& key, const std::string& text) {
    try {
        std::size_t consumed = 0;
        auto value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw ConfigError("Trailing characters in '" + key + "': '" + text + "'");
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ConfigError("Expected a number for '" + key + "', got '" + text + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError("Number out of range for '" + key + "': '" + text + "'");
    }
}

} // namespace

// StreamsConfig

StreamsConfig StreamsConfig::from_properties(const Properties& props) {
    StreamsConfig config;
    if (auto* value = find(props, "application.id")) {
        config.application_id = *value;
    }
    if (auto* value = find(props, "bootstrap.servers")) {
        config.bootstrap_servers = *value;
    }
    if (auto* value = find(props, "application.server"); value && !value->empty()) {
        config.application_server = HostInfo::parse(*value);
    }
    if (auto* value = find(props, "num.stream.threads")) {
        auto threads = parse_bounded<std::uint32_t>("num.stream.threads", *value);
        if (threads < 1) {
            throw ConfigError("num.stream.threads must be at least 1");
        }
        config.num_stream_threads = threads;
    }
    if (auto* value = find(props, "num.partitions")) {
        auto partitions = parse_bounded<int>("num.partitions", *value);
        if (partitions < 1) {
            throw ConfigError("num.partitions must be at least 1");
        }
        config.num_partitions = partitions;
    }
    return config;
}

void StreamsConfig::validate() const {
    if (application_id.empty()) {
        throw ConfigError("application.id is required");
    }
    if (num_stream_threads == 0) {
        throw ConfigError("num.stream.threads must be at least 1");
    }
    if (num_partitions < 1) {
        throw ConfigError("num.partitions must be at least 1");
    }
}

// RetryPolicy

std::chrono::milliseconds RetryPolicy::backoff_for(int attempt) const {
    if (attempt < 1 || multiplier == 1.0) {
        return std::min(backoff_period, max_backoff);
    }
    auto scaled = static_cast<double>(backoff_period.count())
        * std::pow(multiplier, static_cast<double>(attempt - 1));
    auto capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

void RetryPolicy::validate() const {
    if (max_attempts < 1) {
        throw ConfigError("state-store-retry.max-attempts must be at least 1");
    }
    if (backoff_period.count() < 0 || max_backoff.count() < 0) {
        throw ConfigError("state-store-retry intervals must not be negative");
    }
    if (multiplier < 1.0) {
        throw ConfigError("state-store-retry.multiplier must be at least 1.0");
    }
}

// BinderConfig

BinderConfig BinderConfig::from_properties(const Properties& props, const std::string& prefix) {
    BinderConfig config;
    const std::string passthrough = prefix + "configuration.";

    for (const auto& [key, value] : props) {
        if (key.compare(0, passthrough.size(), passthrough) == 0) {
            config.configuration[key.substr(passthrough.size())] = value;
        }
    }

    if (auto* value = find(props, prefix + "brokers")) {
        config.brokers = *value;
    }
    if (auto* value = find(props, prefix + "application-id")) {
        config.application_id = *value;
    } else if (auto* name = find(props, "application.name")) {
        config.application_id = *name;
    }
    if (auto* value = find(props, prefix + "log-level")) {
        config.log_level = *value;
    }

    const std::string retry = prefix + "state-store-retry.";
    if (auto* value = find(props, retry + "max-attempts")) {
        config.state_store_retry.max_attempts = parse_bounded<int>(retry + "max-attempts", *value);
    }
    if (auto* value = find(props, retry + "backoff-period")) {
        config.state_store_retry.backoff_period =
            std::chrono::milliseconds(parse_integer(retry + "backoff-period", *value));
    }
    if (auto* value = find(props, retry + "multiplier")) {
        config.state_store_retry.multiplier = parse_double(retry + "multiplier", *value);
    }
    if (auto* value = find(props, retry + "max-backoff")) {
        config.state_store_retry.max_backoff =
            std::chrono::milliseconds(parse_integer(retry + "max-backoff", *value));
    }

    config.state_store_retry.validate();
    return config;
}

std::optional<std::string> BinderConfig::application_server() const {
    auto it = configuration.find("application.server");
    if (it == configuration.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

StreamsConfig BinderConfig::streams_config() const {
    Properties props = configuration;

    if (!application_id.empty()) {
        props["application.id"] = application_id;
    }

    auto servers = props.find("bootstrap.servers");
    if (servers == props.end() || servers->second.empty()
        || servers->second == DEFAULT_BOOTSTRAP_SERVERS) {
        if (servers != props.end() && brokers != DEFAULT_BOOTSTRAP_SERVERS) {
            STREAMIQ_DEBUG("replacing default bootstrap.servers with binder brokers {}", brokers);
        }
        props["bootstrap.servers"] = brokers;
    }

    return StreamsConfig::from_properties(props);
}

} // namespace streamiq
