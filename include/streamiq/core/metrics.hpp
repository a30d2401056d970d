#pragma once

/**
 * @file metrics.hpp
 * @brief Metric primitives and binder-level instance metrics
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "streamiq/core/streams_instance.hpp"

namespace streamiq {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down)
 */
class Gauge {
public:
    void set(std::int64_t value) noexcept {
        value_.store(value, std::memory_order_relaxed);
    }

    void increment(std::int64_t delta = 1) noexcept {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(std::int64_t delta = 1) noexcept {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> value_{0};
};

struct InstanceMetrics {
    std::string application_id;
    StreamsState state;
    std::uint64_t transitions;
};

/**
 * @brief Tracks the engine instances a registry hands it
 *
 * Subscribes to each bound instance's state listener, so it must
 * outlive every instance it is bound to.
 */
class StreamsBinderMetrics {
public:
    void bind_instance(StreamsInstance& instance);

    [[nodiscard]] const Gauge& registered_instances() const noexcept { return registered_; }
    [[nodiscard]] const Gauge& running_instances() const noexcept { return running_; }
    [[nodiscard]] const Counter& state_transitions() const noexcept { return transitions_; }

    /**
     * @brief Current state per bound instance, in binding order
     */
    [[nodiscard]] std::vector<InstanceMetrics> snapshot() const;

    [[nodiscard]] std::string format() const;

private:
    struct Entry {
        std::string application_id;
        std::atomic<StreamsState> state{StreamsState::Created};
        Counter transitions;

        // Guards the hand-over from the subscription to the listener
        std::mutex mutex;
        bool bound{false};

        explicit Entry(std::string id)
            : application_id(std::move(id)) {}
    };

    void on_transition(Entry& entry, StreamsState new_state, StreamsState old_state);

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Entry>> entries_;

    Gauge registered_;
    Gauge running_;
    Counter transitions_;
};

} // namespace streamiq
