#pragma once

/**
 * @file engine.hpp
 * @brief Stream processing engine running one topology
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "streamiq/cluster/group_coordinator.hpp"
#include "streamiq/core/config.hpp"
#include "streamiq/core/queue.hpp"
#include "streamiq/core/stream_thread.hpp"
#include "streamiq/core/streams_instance.hpp"
#include "streamiq/core/topology.hpp"

namespace streamiq {

/**
 * @brief Engine instance: runs a topology and serves its state stores
 *
 * start() returns immediately. Stores are restored on a background
 * thread while the engine is Rebalancing; processing starts and the
 * engine turns Running only once every store is restored. Queries
 * made before that get a Transient lookup error.
 *
 * Engines sharing a GroupCoordinator form one cluster: partitions are
 * spread over them and each membership change puts every running
 * member through Rebalancing again.
 */
class StreamsEngine : public StreamsInstance {
public:
    /**
     * @param coordinator Group to join; a private one is created if null
     * @throws ConfigError on invalid config
     * @throws std::invalid_argument on an inconsistent topology, or if
     *         the coordinator belongs to another application id
     */
    StreamsEngine(
        TopologyBuilder topology,
        StreamsConfig config,
        std::shared_ptr<GroupCoordinator> coordinator = nullptr
    );

    ~StreamsEngine() override;

    StreamsEngine(const StreamsEngine&) = delete;
    StreamsEngine& operator=(const StreamsEngine&) = delete;

    /**
     * @throws std::runtime_error unless the engine is Created
     */
    void start();

    /**
     * @brief Stop sources, drain queues, close stores and leave the group
     *
     * Idempotent. Blocks until a restore in progress has finished.
     */
    void close();

    /**
     * @brief Wait until the engine is Running
     * @return false on timeout or if the engine shut down first
     */
    bool await_running(std::chrono::milliseconds timeout) const;

    // StreamsInstance
    [[nodiscard]] const std::string& application_id() const noexcept override { return config_.application_id; }
    [[nodiscard]] StreamsState state() const override;
    [[nodiscard]] StoreLookupResult store(const std::string& name, StoreType type) override;
    [[nodiscard]] std::optional<StreamsMetadata> metadata_for_key(
        const std::string& store_name,
        const Bytes& serialized_key
    ) const override;
    [[nodiscard]] std::vector<StreamsMetadata> all_metadata_for_store(
        const std::string& store_name
    ) const override;
    [[nodiscard]] std::optional<HostInfo> application_server() const override { return config_.application_server; }
    StreamsState add_state_listener(StateListener listener) override;

    [[nodiscard]] const StreamsConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::string& member_id() const noexcept { return member_id_; }
    [[nodiscard]] std::set<int> assigned_partitions() const;
    [[nodiscard]] std::uint64_t records_processed() const;

private:
    struct SourceTask {
        SourceProcessor* source;
        ProcessorNode* node;
    };

    bool set_state(StreamsState next);
    void restore_and_run();
    void on_assignment(std::uint64_t generation, const std::set<int>& partitions);
    void start_processing();
    void stop_processing();
    void drain_queues();

    StreamsConfig config_;
    std::string member_id_;
    std::shared_ptr<GroupCoordinator> coordinator_;

    std::vector<std::unique_ptr<ProcessorNode>> nodes_;
    std::vector<std::shared_ptr<RecordQueue>> queues_;
    std::vector<SourceTask> sources_;
    std::vector<std::unique_ptr<StreamThread>> stream_threads_;
    std::vector<std::thread> source_threads_;
    std::thread restore_thread_;

    // Fixed at construction
    std::unordered_map<std::string, std::shared_ptr<StateStore>> stores_;
    std::unordered_map<std::string, StoreDescriptor> descriptors_;

    // Held across listener calls so listeners see transitions in order,
    // and by add_state_listener so a subscriber misses none
    std::mutex transition_mutex_;
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    StreamsState state_{StreamsState::Created};
    Assignment assignment_;
    std::vector<StateListener> listeners_;

    // Serializes store state changes between rebalances and close()
    std::mutex store_mutex_;
    std::atomic<bool> closing_{false};
    std::atomic<bool> processing_{false};
};

} // namespace streamiq
