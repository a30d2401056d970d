#pragma once

/**
 * @file interactive_query_service.hpp
 * @brief Store and host lookups across the registered engine instances
 */

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "streamiq/cluster/host_info.hpp"
#include "streamiq/core/config.hpp"
#include "streamiq/core/errors.hpp"
#include "streamiq/iq/streams_registry.hpp"
#include "streamiq/serialization/serializer.hpp"
#include "streamiq/state/queryable_store_types.hpp"

namespace streamiq {

/**
 * @brief Blocks the calling thread between lookup attempts
 */
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Entry point for application code querying state stores
 *
 * Store lookups retry on the calling thread while the store is
 * restoring or its instance is rebalancing, following
 * BinderConfig::state_store_retry. Host lookups are answered from the
 * partition metadata of the registered instances and never retry.
 */
class InteractiveQueryService {
public:
    InteractiveQueryService(
        const StreamsRegistry& registry,
        BinderConfig config,
        Sleeper sleeper = default_sleeper()
    );

    /**
     * @brief Read-only handle on the first instance serving the store
     *
     * @code
     * auto counts = service.get_queryable_store(
     *     "prod-id-count-store", queryable_store_types::key_value_store());
     * auto count = counts.get(std::int64_t{123});
     * @endcode
     *
     * @throws StoreNotFoundError if no instance hosts the store
     * @throws StoreRetriesExhaustedError if it stayed unavailable for
     *         every attempt
     */
    template<typename QueryableType>
    [[nodiscard]] typename QueryableType::handle_type get_queryable_store(
        const std::string& store_name,
        const QueryableType& type
    ) const {
        return type.create(locate_store(store_name, type.store_type()));
    }

    /**
     * @brief Advertised endpoint of this process (application.server)
     * @throws ConfigError if not configured or malformed
     */
    [[nodiscard]] HostInfo get_current_host_info() const;

    /**
     * @brief Endpoint of the instance serving the partition of key
     * @return nullopt if no instance knows the store
     */
    template<typename K>
    [[nodiscard]] std::optional<HostInfo> get_host_info(
        const std::string& store_name,
        const K& key,
        const Serializer<K>& serializer
    ) const {
        return host_for_key(store_name, serializer.serialize(key));
    }

    /**
     * @brief Endpoints of every cluster member hosting the store
     */
    [[nodiscard]] std::vector<HostInfo> get_all_host_info(const std::string& store_name) const;

    [[nodiscard]] const BinderConfig& config() const noexcept { return config_; }

    static Sleeper default_sleeper();

private:
    [[nodiscard]] std::shared_ptr<StateStore> locate_store(const std::string& store_name, StoreType type) const;
    [[nodiscard]] std::optional<HostInfo> host_for_key(const std::string& store_name, const Bytes& key) const;

    const StreamsRegistry& registry_;
    BinderConfig config_;
    Sleeper sleeper_;
};

} // namespace streamiq
