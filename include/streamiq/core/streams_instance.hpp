#pragma once

/**
 * @file streams_instance.hpp
 * @brief What the query layer needs from a running engine
 */

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "streamiq/cluster/host_info.hpp"
#include "streamiq/core/errors.hpp"
#include "streamiq/core/record.hpp"
#include "streamiq/state/state_store.hpp"

namespace streamiq {

/**
 * @brief Engine lifecycle
 *
 * Created -> Rebalancing -> Running -> [Rebalancing -> Running]*
 *         -> PendingShutdown -> NotRunning
 * Created, Rebalancing and Running may move to Error.
 */
enum class StreamsState {
    Created,
    Rebalancing,
    Running,
    PendingShutdown,
    NotRunning,
    Error
};

const char* to_string(StreamsState state) noexcept;

/**
 * @brief A store, or why this instance cannot serve it right now
 */
using StoreLookupResult = std::variant<std::shared_ptr<StateStore>, StoreLookupError>;

using StateListener = std::function<void(StreamsState new_state, StreamsState old_state)>;

/**
 * @brief Handle to one engine instance running in this process
 */
class StreamsInstance {
public:
    virtual ~StreamsInstance() = default;

    [[nodiscard]] virtual const std::string& application_id() const noexcept = 0;

    [[nodiscard]] virtual StreamsState state() const = 0;

    /**
     * @brief Look up a materialized store by name and expected type
     *
     * Never blocks. Returns a Transient error while the engine or the
     * store is still restoring or rebalancing, and a Permanent one if
     * this instance's topology does not define the store, defines it
     * with another type, or has shut down.
     */
    [[nodiscard]] virtual StoreLookupResult store(const std::string& name, StoreType type) = 0;

    /**
     * @brief Member owning the partition of a serialized key
     * @return nullopt if no member hosts the store
     */
    [[nodiscard]] virtual std::optional<StreamsMetadata> metadata_for_key(
        const std::string& store_name,
        const Bytes& serialized_key
    ) const = 0;

    [[nodiscard]] virtual std::vector<StreamsMetadata> all_metadata_for_store(
        const std::string& store_name
    ) const = 0;

    /**
     * @brief Endpoint this instance advertises, if configured
     */
    [[nodiscard]] virtual std::optional<HostInfo> application_server() const = 0;

    /**
     * @brief Subscribe to state transitions
     *
     * The listener sees every transition after the returned state, in
     * order. Must not be called from inside a listener.
     *
     * @return State at the moment of subscription
     */
    virtual StreamsState add_state_listener(StateListener listener) = 0;
};

} // namespace streamiq
