#pragma once

/**
 * @file topology.hpp
 * @brief Topology builder: processors, edges and materialized stores
 */

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "streamiq/core/processor.hpp"
#include "streamiq/state/state_store.hpp"

namespace streamiq {

struct Edge {
    std::string from_processor;
    std::string to_processor;
    std::size_t queue_capacity{4096};
};

/**
 * @brief A store declaration and the processors allowed to use it
 */
struct StoreConnection {
    StoreDescriptor descriptor;
    std::vector<std::string> processors;
};

/**
 * @brief Describes the processing graph one engine runs
 *
 * Names are unique per topology: processor names among processors,
 * store names among stores.
 */
class TopologyBuilder {
public:
    TopologyBuilder& add_source(std::unique_ptr<SourceProcessor> source) {
        auto name = source->name();
        add_node(std::move(source));
        sources_.push_back(std::move(name));
        return *this;
    }

    TopologyBuilder& add_processor(std::unique_ptr<Processor> processor) {
        return add_node(std::move(processor));
    }

    TopologyBuilder& add_sink(std::unique_ptr<SinkProcessor> sink) {
        auto name = sink->name();
        add_node(std::move(sink));
        sinks_.push_back(std::move(name));
        return *this;
    }

    TopologyBuilder& connect(
        const std::string& from,
        const std::string& to,
        std::size_t queue_capacity = 4096
    ) {
        edges_.push_back({from, to, queue_capacity});
        return *this;
    }

    /**
     * @brief Materialize a store and give the named processors access to it
     */
    TopologyBuilder& add_state_store(
        StoreDescriptor descriptor,
        std::vector<std::string> processor_names
    ) {
        if (has_store(descriptor.name)) {
            throw std::invalid_argument("State store '" + descriptor.name + "' already declared");
        }
        stores_.push_back({std::move(descriptor), std::move(processor_names)});
        return *this;
    }

    /**
     * @brief Check that every edge and store connection names a known processor
     * @throws std::invalid_argument on the first dangling reference
     */
    void validate() const {
        for (const auto& edge : edges_) {
            require_processor(edge.from_processor, "edge");
            require_processor(edge.to_processor, "edge");
        }
        for (const auto& store : stores_) {
            for (const auto& name : store.processors) {
                require_processor(name, "state store '" + store.descriptor.name + "'");
            }
        }
    }

    [[nodiscard]] bool has_store(const std::string& name) const {
        return find_store(name) != nullptr;
    }

    [[nodiscard]] const StoreDescriptor* find_store(const std::string& name) const {
        for (const auto& store : stores_) {
            if (store.descriptor.name == name) {
                return &store.descriptor;
            }
        }
        return nullptr;
    }

    [[nodiscard]] std::unordered_map<std::string, std::unique_ptr<Processor>>& processors() {
        return processors_;
    }

    [[nodiscard]] const std::vector<Edge>& edges() const { return edges_; }
    [[nodiscard]] const std::vector<std::string>& sources() const { return sources_; }
    [[nodiscard]] const std::vector<std::string>& sinks() const { return sinks_; }
    [[nodiscard]] const std::vector<StoreConnection>& stores() const { return stores_; }

private:
    TopologyBuilder& add_node(std::unique_ptr<Processor> processor) {
        auto name = processor->name();
        if (!processors_.emplace(name, std::move(processor)).second) {
            throw std::invalid_argument("Processor '" + name + "' already declared");
        }
        return *this;
    }

    void require_processor(const std::string& name, const std::string& where) const {
        if (processors_.find(name) == processors_.end()) {
            throw std::invalid_argument("Unknown processor '" + name + "' referenced by " + where);
        }
    }

    std::unordered_map<std::string, std::unique_ptr<Processor>> processors_;
    std::vector<Edge> edges_;
    std::vector<std::string> sources_;
    std::vector<std::string> sinks_;
    std::vector<StoreConnection> stores_;
};

} // namespace streamiq
