#pragma once

/**
 * @file serializer.hpp
 * @brief Key serializers used to place keys on partitions
 *
 * Encodings match the broker client's stock serializers so a key
 * hashes to the same partition it was produced to.
 */

#include <cstdint>
#include <string>
#include <type_traits>

#include "streamiq/core/record.hpp"

namespace streamiq {

template<typename T>
class Serializer {
public:
    virtual ~Serializer() = default;

    [[nodiscard]] virtual Bytes serialize(const T& value) const = 0;
};

namespace detail {

template<typename Int>
Bytes big_endian(Int value) {
    auto bits = static_cast<std::make_unsigned_t<Int>>(value);
    Bytes out(sizeof(Int));
    for (std::size_t i = 0; i < sizeof(Int); i++) {
        out[sizeof(Int) - 1 - i] = static_cast<std::byte>(bits & 0xffu);
        bits >>= 8;
    }
    return out;
}

} // namespace detail

/**
 * @brief 4-byte big-endian
 */
class IntegerSerializer : public Serializer<std::int32_t> {
public:
    [[nodiscard]] Bytes serialize(const std::int32_t& value) const override {
        return detail::big_endian(value);
    }
};

/**
 * @brief 8-byte big-endian
 */
class LongSerializer : public Serializer<std::int64_t> {
public:
    [[nodiscard]] Bytes serialize(const std::int64_t& value) const override {
        return detail::big_endian(value);
    }
};

/**
 * @brief Raw UTF-8 bytes
 */
class StringSerializer : public Serializer<std::string> {
public:
    [[nodiscard]] Bytes serialize(const std::string& value) const override {
        Bytes out(value.size());
        for (std::size_t i = 0; i < value.size(); i++) {
            out[i] = static_cast<std::byte>(value[i]);
        }
        return out;
    }
};

} // namespace streamiq
