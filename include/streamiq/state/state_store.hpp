#pragma once

/**
 * @file state_store.hpp
 * @brief Common state store base and store descriptors
 */

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "streamiq/core/errors.hpp"

namespace streamiq {

enum class StoreType {
    KeyValue,
    Window,
    Session
};

/**
 * @brief Lifecycle of a materialized store
 *
 * Only Running stores are handed out to queries. A store re-enters
 * Restoring when its engine rebalances.
 */
enum class StoreState {
    Restoring,
    Running,
    Closed
};

const char* to_string(StoreType type) noexcept;
const char* to_string(StoreState state) noexcept;

/**
 * @brief Base class for all materialized stores
 */
class StateStore {
public:
    explicit StateStore(std::string name)
        : name_(std::move(name)) {}

    virtual ~StateStore() = default;

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    [[nodiscard]] virtual StoreType type() const noexcept = 0;

    /**
     * @brief Drop all contents, used before replaying a changelog
     */
    virtual void clear() = 0;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] StoreState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_open() const noexcept { return state() == StoreState::Running; }

    void mark_restoring() noexcept { state_.store(StoreState::Restoring, std::memory_order_release); }
    void mark_running() noexcept { state_.store(StoreState::Running, std::memory_order_release); }
    void close() noexcept { state_.store(StoreState::Closed, std::memory_order_release); }

    /**
     * @brief Throw unless the store is serving queries
     */
    void ensure_open() const {
        auto current = state();
        if (current != StoreState::Running) {
            throw InvalidStateStoreError("State store '" + name_ + "' is "
                + to_string(current) + ", not RUNNING");
        }
    }

private:
    std::string name_;
    std::atomic<StoreState> state_{StoreState::Restoring};
};

/**
 * @brief Declaration of a materialized store in a topology
 */
struct StoreDescriptor {
    std::string name;
    StoreType type{StoreType::KeyValue};

    // Window and session stores drop entries older than this
    std::chrono::milliseconds retention{std::chrono::hours(24)};

    // Replays a changelog into the store while it is Restoring
    std::function<void(StateStore&)> restorer;
};

/**
 * @brief Create the in-memory store matching a descriptor
 */
std::shared_ptr<StateStore> make_store(const StoreDescriptor& descriptor);

} // namespace streamiq
