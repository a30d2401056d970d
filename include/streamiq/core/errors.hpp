#pragma once

/**
 * @file errors.hpp
 * @brief Error types raised by the query service and the engine
 */

#include <stdexcept>
#include <string>

namespace streamiq {

/**
 * @brief Base of every state store access failure
 *
 * Also thrown directly by read-only handles whose store was closed or
 * went back into restoration after the handle was obtained.
 */
class InvalidStateStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief No registered instance hosts the store, or it is closed for good
 */
class StoreNotFoundError : public InvalidStateStoreError {
public:
    StoreNotFoundError(std::string store_name, const std::string& reason)
        : InvalidStateStoreError("State store '" + store_name + "' not found: " + reason)
        , store_name_(std::move(store_name)) {}

    [[nodiscard]] const std::string& store_name() const noexcept { return store_name_; }

private:
    std::string store_name_;
};

/**
 * @brief The store stayed unavailable for every configured attempt
 */
class StoreRetriesExhaustedError : public InvalidStateStoreError {
public:
    StoreRetriesExhaustedError(std::string store_name, int attempts, const std::string& last_reason)
        : InvalidStateStoreError("Error when retrieving state store '" + store_name
              + "' after " + std::to_string(attempts) + " attempt(s): " + last_reason)
        , store_name_(std::move(store_name))
        , attempts_(attempts) {}

    [[nodiscard]] const std::string& store_name() const noexcept { return store_name_; }
    [[nodiscard]] int attempts() const noexcept { return attempts_; }

private:
    std::string store_name_;
    int attempts_;
};

/**
 * @brief Missing or malformed configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Failure reported by an engine for a single store lookup
 */
struct StoreLookupError {
    enum class Kind {
        Transient,      // Exists but not serving yet (restoring, rebalancing)
        Permanent       // Not defined on this instance, or closed
    };

    Kind kind;
    std::string message;

    static StoreLookupError transient(std::string msg) {
        return {Kind::Transient, std::move(msg)};
    }

    static StoreLookupError permanent(std::string msg) {
        return {Kind::Permanent, std::move(msg)};
    }

    [[nodiscard]] bool is_transient() const noexcept { return kind == Kind::Transient; }
};

} // namespace streamiq
