#pragma once

/**
 * @file partitioner.hpp
 * @brief Key to partition mapping
 */

#include <cstdint>

#include "streamiq/core/record.hpp"

namespace streamiq {

/**
 * @brief 32-bit murmur2 as the broker client's default partitioner computes it
 */
std::int32_t murmur2(const Bytes& data) noexcept;

/**
 * @brief Partition of a serialized key among num_partitions
 *
 * Same result as the default producer partitioner for keyed records.
 */
int partition_for(const Bytes& serialized_key, int num_partitions);

} // namespace streamiq
