#pragma once

/**
 * @file processor.hpp
 * @brief Processor interface and the context processors run in
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "streamiq/core/queue.hpp"
#include "streamiq/core/record.hpp"
#include "streamiq/state/state_store.hpp"

namespace streamiq {

struct ProcessorStats {
    std::atomic<std::uint64_t> records_received{0};
    std::atomic<std::uint64_t> records_forwarded{0};
    std::atomic<std::uint64_t> records_dropped{0};
    std::atomic<std::uint64_t> processing_time_ns{0};
};

/**
 * @brief Per-node context: downstream queues and connected stores
 */
class ProcessorContext {
public:
    ProcessorContext(std::string name, std::string application_id)
        : name_(std::move(name))
        , application_id_(std::move(application_id)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& application_id() const noexcept { return application_id_; }

    void add_output(std::shared_ptr<RecordQueue> queue) {
        outputs_.push_back(std::move(queue));
    }

    void connect_store(std::shared_ptr<StateStore> store) {
        auto name = store->name();
        stores_[name] = std::move(store);
    }

    /**
     * @brief Forward a record to every downstream node
     * @return Number of downstream queues that accepted it
     */
    std::size_t forward(const Record& record) {
        std::size_t count = 0;
        for (auto& output : outputs_) {
            if (output->push(record)) {
                count++;
            }
        }
        return count;
    }

    /**
     * @brief Look up a store connected to this node
     * @throws std::runtime_error if not connected or of another type
     */
    template<typename Store>
    Store& state_store(const std::string& store_name) {
        auto it = stores_.find(store_name);
        if (it == stores_.end()) {
            throw std::runtime_error("Processor '" + name_
                + "' has no access to state store '" + store_name + "'");
        }
        auto* typed = dynamic_cast<Store*>(it->second.get());
        if (!typed) {
            throw std::runtime_error("State store '" + store_name + "' is a "
                + to_string(it->second->type()) + " store");
        }
        return *typed;
    }

    [[nodiscard]] std::size_t output_count() const noexcept { return outputs_.size(); }

private:
    std::string name_;
    std::string application_id_;
    std::vector<std::shared_ptr<RecordQueue>> outputs_;
    std::unordered_map<std::string, std::shared_ptr<StateStore>> stores_;
};

/**
 * @brief Base class for all topology nodes
 */
class Processor {
public:
    explicit Processor(std::string name)
        : name_(std::move(name)) {}

    virtual ~Processor() = default;

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    /**
     * @brief Called once after stores are restored, before the first record
     */
    virtual void init(ProcessorContext& ctx) {
        (void)ctx;
    }

    virtual void process(Record& record, ProcessorContext& ctx) = 0;

    virtual void close(ProcessorContext& ctx) {
        (void)ctx;
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const ProcessorStats& stats() const noexcept { return stats_; }

protected:
    void record_received() noexcept { stats_.records_received++; }
    void record_forwarded() noexcept { stats_.records_forwarded++; }
    void record_dropped() noexcept { stats_.records_dropped++; }

    /**
     * @brief Accumulates the time since construction into processing_time_ns
     */
    class ProcessingTimer {
    public:
        explicit ProcessingTimer(ProcessorStats& stats)
            : stats_(stats)
            , start_(std::chrono::steady_clock::now()) {}

        ~ProcessingTimer() {
            auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - start_).count();
            stats_.processing_time_ns += static_cast<std::uint64_t>(ns);
        }

    private:
        ProcessorStats& stats_;
        std::chrono::steady_clock::time_point start_;
    };

    [[nodiscard]] ProcessingTimer time_processing() noexcept { return ProcessingTimer(stats_); }

private:
    std::string name_;
    ProcessorStats stats_;
};

/**
 * @brief Node without an input queue that produces records
 */
class SourceProcessor : public Processor {
public:
    using Processor::Processor;

    /**
     * @brief Produce zero or more records
     * @return false once the source is exhausted
     */
    virtual bool generate(ProcessorContext& ctx) = 0;

    void process(Record& /*record*/, ProcessorContext& /*ctx*/) final {}

    [[nodiscard]] bool should_stop() const noexcept {
        return stop_requested_.load(std::memory_order_acquire);
    }

    void request_stop() noexcept {
        stop_requested_.store(true, std::memory_order_release);
    }

private:
    std::atomic<bool> stop_requested_{false};
};

/**
 * @brief Terminal node
 */
class SinkProcessor : public Processor {
public:
    using Processor::Processor;

    virtual void consume(const Record& record) = 0;

    void process(Record& record, ProcessorContext& /*ctx*/) final {
        record_received();
        consume(record);
    }
};

} // namespace streamiq
