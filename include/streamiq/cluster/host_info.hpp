#pragma once

/**
 * @file host_info.hpp
 * @brief Advertised endpoints and per-member cluster metadata
 */

#include <set>
#include <string>
#include <tuple>

namespace streamiq {

/**
 * @brief host:port an engine advertises for interactive queries
 */
struct HostInfo {
    std::string host;
    int port{-1};

    /**
     * @brief Placeholder for a member that advertises no endpoint
     */
    static HostInfo unavailable() { return {"unavailable", -1}; }

    /**
     * @brief Parse "host:port"
     * @throws ConfigError if the port is missing or out of range
     */
    static HostInfo parse(const std::string& address);

    [[nodiscard]] std::string to_string() const {
        return host + ":" + std::to_string(port);
    }

    bool operator==(const HostInfo& other) const noexcept {
        return host == other.host && port == other.port;
    }

    bool operator!=(const HostInfo& other) const noexcept { return !(*this == other); }

    bool operator<(const HostInfo& other) const noexcept {
        return std::tie(host, port) < std::tie(other.host, other.port);
    }
};

/**
 * @brief What one cluster member hosts
 */
struct StreamsMetadata {
    HostInfo host_info;
    std::set<std::string> state_store_names;
    std::set<int> partitions;

    [[nodiscard]] bool hosts_store(const std::string& store_name) const {
        return state_store_names.count(store_name) > 0;
    }
};

} // namespace streamiq
