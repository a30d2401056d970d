/**
 * @file engine.cpp
 * @brief Engine lifecycle, store restoration and store lookup
 */

#include "streamiq/core/engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "streamiq/logging.hpp"

namespace streamiq {

const char* to_string(StreamsState state) noexcept {
    switch (state) {
        case StreamsState::Created:         return "CREATED";
        case StreamsState::Rebalancing:     return "REBALANCING";
        case StreamsState::Running:         return "RUNNING";
        case StreamsState::PendingShutdown: return "PENDING_SHUTDOWN";
        case StreamsState::NotRunning:      return "NOT_RUNNING";
        case StreamsState::Error:           return "ERROR";
    }
    return "UNKNOWN";
}

namespace {

bool is_valid_transition(StreamsState from, StreamsState to) {
    switch (from) {
        case StreamsState::Created:
            return to == StreamsState::Rebalancing
                || to == StreamsState::PendingShutdown
                || to == StreamsState::Error;
        case StreamsState::Rebalancing:
            return to == StreamsState::Running
                || to == StreamsState::PendingShutdown
                || to == StreamsState::Error;
        case StreamsState::Running:
            return to == StreamsState::Rebalancing
                || to == StreamsState::PendingShutdown
                || to == StreamsState::Error;
        case StreamsState::PendingShutdown:
            return to == StreamsState::NotRunning;
        case StreamsState::Error:
            return to == StreamsState::PendingShutdown;
        case StreamsState::NotRunning:
            return false;
    }
    return false;
}

std::string next_member_id(const std::string& application_id) {
    static std::atomic<std::uint64_t> counter{0};
    return application_id + "-instance-" + std::to_string(++counter);
}

} // namespace

StreamsEngine::StreamsEngine(
    TopologyBuilder topology,
    StreamsConfig config,
    std::shared_ptr<GroupCoordinator> coordinator
)
    : config_(std::move(config))
    , coordinator_(std::move(coordinator)) {
    config_.validate();
    topology.validate();

    if (!coordinator_) {
        coordinator_ = std::make_shared<GroupCoordinator>(
            config_.application_id, config_.num_partitions);
    } else if (coordinator_->application_id() != config_.application_id) {
        throw std::invalid_argument("Coordinator of '" + coordinator_->application_id()
            + "' cannot be joined by '" + config_.application_id + "'");
    }
    member_id_ = next_member_id(config_.application_id);

    // One queue per edge
    std::unordered_map<std::string, std::vector<std::shared_ptr<RecordQueue>>> output_queues;
    std::unordered_map<std::string, std::shared_ptr<RecordQueue>> input_queues;

    for (const auto& edge : topology.edges()) {
        auto& input = input_queues[edge.to_processor];
        if (!input) {
            input = std::make_shared<RecordQueue>(edge.queue_capacity);
            queues_.push_back(input);
        }
        output_queues[edge.from_processor].push_back(input);
    }

    std::unordered_map<std::string, ProcessorNode*> by_name;
    std::vector<ProcessorNode*> processing_nodes;

    for (auto& [name, processor] : topology.processors()) {
        auto input_it = input_queues.find(name);
        std::shared_ptr<RecordQueue> input = input_it != input_queues.end()
            ? input_it->second
            : nullptr;

        auto* source = dynamic_cast<SourceProcessor*>(processor.get());
        auto node = std::make_unique<ProcessorNode>(std::move(processor), input, config_.application_id);

        auto output_it = output_queues.find(name);
        if (output_it != output_queues.end()) {
            for (auto& queue : output_it->second) {
                node->context().add_output(queue);
            }
        }

        if (source) {
            sources_.push_back({source, node.get()});
        } else {
            processing_nodes.push_back(node.get());
        }
        by_name[name] = node.get();
        nodes_.push_back(std::move(node));
    }

    for (const auto& connection : topology.stores()) {
        auto store = make_store(connection.descriptor);
        for (const auto& processor_name : connection.processors) {
            by_name.at(processor_name)->context().connect_store(store);
        }
        stores_.emplace(connection.descriptor.name, std::move(store));
        descriptors_.emplace(connection.descriptor.name, connection.descriptor);
    }

    // Spread processing nodes round-robin over stream threads
    auto thread_count = std::max<std::uint32_t>(1, config_.num_stream_threads);
    std::vector<std::vector<ProcessorNode*>> per_thread(thread_count);
    for (std::size_t i = 0; i < processing_nodes.size(); i++) {
        per_thread[i % thread_count].push_back(processing_nodes[i]);
    }
    for (std::uint32_t i = 0; i < thread_count; i++) {
        stream_threads_.push_back(std::make_unique<StreamThread>(i, std::move(per_thread[i])));
    }
}

StreamsEngine::~StreamsEngine() {
    close();
}

StreamsState StreamsEngine::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

StreamsState StreamsEngine::add_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> transition_lock(transition_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    listeners_.push_back(std::move(listener));
    return state_;
}

std::set<int> StreamsEngine::assigned_partitions() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return assignment_.partitions();
}

std::uint64_t StreamsEngine::records_processed() const {
    std::uint64_t total = 0;
    for (const auto& thread : stream_threads_) {
        total += thread->stats().records_processed.load();
    }
    return total;
}

bool StreamsEngine::set_state(StreamsState next) {
    std::lock_guard<std::mutex> transition_lock(transition_mutex_);

    StreamsState previous;
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!is_valid_transition(state_, next)) {
            STREAMIQ_DEBUG("{} ignoring transition {} -> {}",
                member_id_, to_string(state_), to_string(next));
            return false;
        }
        previous = state_;
        state_ = next;
        listeners = listeners_;
    }
    STREAMIQ_INFO("{} state transition {} -> {}", member_id_, to_string(previous), to_string(next));
    for (auto& listener : listeners) {
        listener(next, previous);
    }

    // Waiters wake only after every listener has seen the transition
    state_cv_.notify_all();
    return true;
}

bool StreamsEngine::await_running(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, timeout, [this] {
        return state_ == StreamsState::Running
            || state_ == StreamsState::PendingShutdown
            || state_ == StreamsState::NotRunning
            || state_ == StreamsState::Error;
    });
    return state_ == StreamsState::Running;
}

void StreamsEngine::start() {
    if (!set_state(StreamsState::Rebalancing)) {
        throw std::runtime_error("Engine " + member_id_ + " cannot start from state "
            + to_string(state()));
    }

    std::set<std::string> store_names;
    for (const auto& [name, store] : stores_) {
        store_names.insert(name);
    }

    coordinator_->join({
        member_id_,
        config_.application_server.value_or(HostInfo::unavailable()),
        std::move(store_names),
        [this](std::uint64_t generation, const std::set<int>& partitions) {
            on_assignment(generation, partitions);
        }
    });

    restore_thread_ = std::thread(&StreamsEngine::restore_and_run, this);
}

void StreamsEngine::restore_and_run() {
    for (auto& [name, store] : stores_) {
        if (closing_.load()) {
            return;
        }

        const auto& descriptor = descriptors_.at(name);
        STREAMIQ_DEBUG("{} restoring {} store {}", member_id_, to_string(store->type()), name);
        try {
            store->clear();
            if (descriptor.restorer) {
                descriptor.restorer(*store);
            }
        } catch (const std::exception& e) {
            STREAMIQ_ERROR("{} failed to restore store {}: {}", member_id_, name, e.what());
            store->close();
            set_state(StreamsState::Error);
            return;
        }

        std::lock_guard<std::mutex> lock(store_mutex_);
        if (closing_.load()) {
            return;
        }
        store->mark_running();
    }

    try {
        for (auto& node : nodes_) {
            node->processor()->init(node->context());
        }
    } catch (const std::exception& e) {
        STREAMIQ_ERROR("{} failed to initialize processors: {}", member_id_, e.what());
        set_state(StreamsState::Error);
        return;
    }
    start_processing();

    if (!set_state(StreamsState::Running)) {
        STREAMIQ_WARN("{} finished restoration after shutdown began", member_id_);
    }
}

void StreamsEngine::on_assignment(std::uint64_t generation, const std::set<int>& partitions) {
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!assignment_.update(generation, partitions)) {
            STREAMIQ_DEBUG("{} dropping stale assignment of generation {} (current {})",
                member_id_, generation, assignment_.generation());
            return;
        }
        was_running = state_ == StreamsState::Running;
    }
    STREAMIQ_DEBUG("{} assigned {} partition(s) in generation {}",
        member_id_, partitions.size(), generation);

    // During start-up the restore thread owns the transition to Running
    if (!was_running || !set_state(StreamsState::Rebalancing)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        if (closing_.load()) {
            return;
        }
        // In-memory stores keep their contents across a rebalance; the
        // Restoring window is what concurrent queries observe.
        for (auto& [name, store] : stores_) {
            store->mark_restoring();
        }
        for (auto& [name, store] : stores_) {
            store->mark_running();
        }
    }

    set_state(StreamsState::Running);
}

void StreamsEngine::start_processing() {
    processing_.store(true, std::memory_order_release);

    for (auto& thread : stream_threads_) {
        thread->start();
    }

    for (auto& task : sources_) {
        source_threads_.emplace_back([this, task]() {
            while (processing_.load(std::memory_order_acquire) && !task.source->should_stop()) {
                if (!task.source->generate(task.node->context())) {
                    break;
                }
            }
        });
    }
}

void StreamsEngine::stop_processing() {
    for (auto& task : sources_) {
        task.source->request_stop();
    }
    for (auto& thread : source_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    source_threads_.clear();

    if (processing_.load()) {
        drain_queues();
    }
    processing_.store(false, std::memory_order_release);

    for (auto& queue : queues_) {
        queue->close();
    }
    for (auto& thread : stream_threads_) {
        thread->stop();
    }
    for (auto& thread : stream_threads_) {
        thread->join();
    }
}

void StreamsEngine::drain_queues() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        bool pending = std::any_of(queues_.begin(), queues_.end(),
            [](const auto& queue) { return !queue->empty(); });
        if (!pending) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    STREAMIQ_WARN("{} closing with undrained records", member_id_);
}

void StreamsEngine::close() {
    auto current = state();
    if (current == StreamsState::PendingShutdown || current == StreamsState::NotRunning) {
        return;
    }
    if (closing_.exchange(true)) {
        return;
    }

    set_state(StreamsState::PendingShutdown);

    if (restore_thread_.joinable()) {
        restore_thread_.join();
    }

    stop_processing();

    for (auto& node : nodes_) {
        node->processor()->close(node->context());
    }

    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        for (auto& [name, store] : stores_) {
            store->close();
        }
    }

    if (current != StreamsState::Created) {
        coordinator_->leave(member_id_);
    }

    set_state(StreamsState::NotRunning);
}

StoreLookupResult StreamsEngine::store(const std::string& name, StoreType type) {
    auto it = stores_.find(name);
    if (it == stores_.end()) {
        return StoreLookupError::permanent("State store '" + name
            + "' is not defined in the topology of " + member_id_);
    }

    const auto& store = it->second;
    if (store->type() != type) {
        return StoreLookupError::permanent("State store '" + name + "' is a "
            + to_string(store->type()) + " store, not " + to_string(type));
    }

    auto current = state();
    switch (current) {
        case StreamsState::Created:
        case StreamsState::Rebalancing:
            return StoreLookupError::transient("Engine " + member_id_ + " is "
                + to_string(current) + ", store '" + name + "' is not queryable yet");
        case StreamsState::PendingShutdown:
        case StreamsState::NotRunning:
        case StreamsState::Error:
            return StoreLookupError::permanent("Engine " + member_id_ + " is "
                + to_string(current));
        case StreamsState::Running:
            break;
    }

    switch (store->state()) {
        case StoreState::Restoring:
            return StoreLookupError::transient("State store '" + name + "' is restoring");
        case StoreState::Closed:
            return StoreLookupError::permanent("State store '" + name + "' is closed");
        case StoreState::Running:
            break;
    }
    return store;
}

std::optional<StreamsMetadata> StreamsEngine::metadata_for_key(
    const std::string& store_name,
    const Bytes& serialized_key
) const {
    return coordinator_->metadata_for_key(store_name, serialized_key);
}

std::vector<StreamsMetadata> StreamsEngine::all_metadata_for_store(const std::string& store_name) const {
    return coordinator_->all_metadata_for_store(store_name);
}

} // namespace streamiq
