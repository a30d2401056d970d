#pragma once

/**
 * @file streams_registry.hpp
 * @brief Registry of the engine instances started in this process
 */

#include <shared_mutex>
#include <vector>

#include "streamiq/core/metrics.hpp"
#include "streamiq/core/streams_instance.hpp"

namespace streamiq {

/**
 * @brief Non-owning set of live engine instances
 *
 * Registered instances must outlive the registry or be unregistered
 * before they are destroyed.
 */
class StreamsRegistry {
public:
    /**
     * @param metrics Notified once per newly registered instance; may be null
     */
    explicit StreamsRegistry(StreamsBinderMetrics* metrics = nullptr)
        : metrics_(metrics) {}

    StreamsRegistry(const StreamsRegistry&) = delete;
    StreamsRegistry& operator=(const StreamsRegistry&) = delete;

    /**
     * @brief Add an instance; registering it again has no effect
     */
    void register_instance(StreamsInstance& instance);

    /**
     * @return false if the instance was not registered
     */
    bool unregister_instance(StreamsInstance& instance);

    /**
     * @brief Snapshot in registration order
     */
    [[nodiscard]] std::vector<StreamsInstance*> instances() const;

    [[nodiscard]] std::size_t size() const;

private:
    StreamsBinderMetrics* metrics_;

    mutable std::shared_mutex mutex_;
    std::vector<StreamsInstance*> instances_;
};

} // namespace streamiq
