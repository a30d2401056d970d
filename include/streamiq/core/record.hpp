#pragma once

/**
 * @file record.hpp
 * @brief Record and payload types flowing through a topology
 */

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <variant>
#include <vector>
#include <string>
#include <optional>

namespace streamiq {

/**
 * @brief Wall-clock timestamp in milliseconds since epoch
 *
 * Windowed stores bucket records by this value, so it has to be
 * comparable across processes (steady_clock is not).
 */
using Timestamp = std::int64_t;

/**
 * @brief Serialized key or value
 */
using Bytes = std::vector<std::byte>;

/**
 * @brief Supported key and value types
 */
using Payload = std::variant<
    std::monostate,      // Null
    std::int64_t,
    double,
    std::string,
    Bytes
>;

inline Timestamp now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/**
 * @brief Record metadata
 */
struct RecordMetadata {
    Timestamp timestamp;
    std::optional<std::int64_t> offset;
    std::optional<std::string> source;

    RecordMetadata() : timestamp(now_ms()) {}

    explicit RecordMetadata(Timestamp ts) : timestamp(ts) {}
};

/**
 * @brief Keyed record
 *
 * A null (monostate) key is allowed for records that are not grouped;
 * aggregating processors drop them.
 */
class Record {
public:
    Record() = default;

    explicit Record(Payload value)
        : value_(std::move(value)) {}

    Record(Payload key, Payload value)
        : key_(std::move(key))
        , value_(std::move(value)) {}

    Record(Payload key, Payload value, RecordMetadata meta)
        : key_(std::move(key))
        , value_(std::move(value))
        , metadata_(std::move(meta)) {}

    [[nodiscard]] const Payload& key() const noexcept { return key_; }
    [[nodiscard]] Payload& key() noexcept { return key_; }

    [[nodiscard]] const Payload& value() const noexcept { return value_; }
    [[nodiscard]] Payload& value() noexcept { return value_; }

    [[nodiscard]] const RecordMetadata& metadata() const noexcept { return metadata_; }
    [[nodiscard]] RecordMetadata& metadata() noexcept { return metadata_; }

    [[nodiscard]] Timestamp timestamp() const noexcept { return metadata_.timestamp; }

    [[nodiscard]] bool has_key() const noexcept {
        return !std::holds_alternative<std::monostate>(key_);
    }

    template<typename T>
    [[nodiscard]] bool holds() const noexcept {
        return std::holds_alternative<T>(value_);
    }

    /**
     * @brief Get value as specific type (throws if wrong type)
     */
    template<typename T>
    [[nodiscard]] const T& get() const {
        return std::get<T>(value_);
    }

    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&value_);
    }

private:
    Payload key_;
    Payload value_;
    RecordMetadata metadata_;
};

/**
 * @brief Render a payload for logs and sink output
 */
std::string to_string(const Payload& payload);

} // namespace streamiq
