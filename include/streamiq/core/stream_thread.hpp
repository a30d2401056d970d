#pragma once

/**
 * @file stream_thread.hpp
 * @brief Processing threads that drive topology nodes
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "streamiq/core/processor.hpp"
#include "streamiq/logging.hpp"

namespace streamiq {

/**
 * @brief A processor bound to its input queue and context
 */
class ProcessorNode {
public:
    ProcessorNode(
        std::unique_ptr<Processor> processor,
        std::shared_ptr<RecordQueue> input,
        const std::string& application_id
    )
        : processor_(std::move(processor))
        , input_(std::move(input))
        , context_(processor_->name(), application_id) {}

    [[nodiscard]] Processor* processor() noexcept { return processor_.get(); }
    [[nodiscard]] RecordQueue* input() noexcept { return input_.get(); }
    [[nodiscard]] ProcessorContext& context() noexcept { return context_; }

    [[nodiscard]] bool has_work() const {
        return input_ && !input_->empty();
    }

    /**
     * @brief Process up to max_batch queued records
     * @return Number processed
     */
    std::size_t execute_batch(std::size_t max_batch = 64) {
        if (!input_) {
            return 0;
        }
        std::size_t processed = 0;
        while (processed < max_batch) {
            auto record = input_->try_pop();
            if (!record) {
                break;
            }
            try {
                processor_->process(*record, context_);
            } catch (const std::exception& e) {
                STREAMIQ_ERROR("processor {} failed on record with key {}: {}",
                    processor_->name(), to_string(record->key()), e.what());
            }
            processed++;
        }
        return processed;
    }

private:
    std::unique_ptr<Processor> processor_;
    std::shared_ptr<RecordQueue> input_;
    ProcessorContext context_;
};

struct StreamThreadStats {
    std::atomic<std::uint64_t> records_processed{0};
    std::atomic<std::uint64_t> idle_cycles{0};
};

/**
 * @brief One processing thread cycling round-robin over its nodes
 */
class StreamThread {
public:
    StreamThread(std::uint32_t id, std::vector<ProcessorNode*> nodes)
        : id_(id)
        , nodes_(std::move(nodes)) {}

    ~StreamThread() {
        stop();
        join();
    }

    StreamThread(const StreamThread&) = delete;
    StreamThread& operator=(const StreamThread&) = delete;

    void start() {
        running_.store(true, std::memory_order_release);
        thread_ = std::thread(&StreamThread::run, this);
    }

    void stop() {
        running_.store(false, std::memory_order_release);
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    /**
     * @brief True when none of this thread's nodes has queued input
     */
    [[nodiscard]] bool idle() const {
        for (const auto* node : nodes_) {
            if (node->has_work()) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }
    [[nodiscard]] const StreamThreadStats& stats() const noexcept { return stats_; }

private:
    void run() {
        std::size_t position = 0;
        while (running_.load(std::memory_order_acquire)) {
            std::size_t processed = 0;
            for (std::size_t checked = 0; checked < nodes_.size(); checked++) {
                auto* node = nodes_[position++ % nodes_.size()];
                processed += node->execute_batch();
            }
            if (processed > 0) {
                stats_.records_processed += processed;
            } else {
                stats_.idle_cycles++;
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
        }
    }

    std::uint32_t id_;
    std::vector<ProcessorNode*> nodes_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    StreamThreadStats stats_;
};

} // namespace streamiq
