/**
 * @file partitioner.cpp
 * @brief murmur2 partitioning
 */

#include "streamiq/cluster/partitioner.hpp"

#include <stdexcept>

namespace streamiq {

std::int32_t murmur2(const Bytes& data) noexcept {
    const auto length = static_cast<std::uint32_t>(data.size());
    constexpr std::uint32_t seed = 0x9747b28cu;
    constexpr std::uint32_t m = 0x5bd1e995u;
    constexpr int r = 24;

    auto byte_at = [&data](std::size_t i) {
        return static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(data[i]));
    };

    std::uint32_t h = seed ^ length;
    const std::uint32_t length4 = length / 4;

    for (std::uint32_t i = 0; i < length4; i++) {
        const std::size_t i4 = static_cast<std::size_t>(i) * 4;
        std::uint32_t k = byte_at(i4)
            | (byte_at(i4 + 1) << 8)
            | (byte_at(i4 + 2) << 16)
            | (byte_at(i4 + 3) << 24);
        k *= m;
        k ^= k >> r;
        k *= m;
        h *= m;
        h ^= k;
    }

    const std::size_t tail = length & ~3u;
    switch (length % 4) {
        case 3:
            h ^= byte_at(tail + 2) << 16;
            [[fallthrough]];
        case 2:
            h ^= byte_at(tail + 1) << 8;
            [[fallthrough]];
        case 1:
            h ^= byte_at(tail);
            h *= m;
            break;
        default:
            break;
    }

    h ^= h >> 13;
    h *= m;
    h ^= h >> 15;

    return static_cast<std::int32_t>(h);
}

int partition_for(const Bytes& serialized_key, int num_partitions) {
    if (num_partitions <= 0) {
        throw std::invalid_argument("num_partitions must be positive");
    }
    // Clear the sign bit rather than abs(), which overflows on INT_MIN
    auto positive = static_cast<std::uint32_t>(murmur2(serialized_key)) & 0x7fffffffu;
    return static_cast<int>(positive % static_cast<std::uint32_t>(num_partitions));
}

} // namespace streamiq
