#pragma once

/**
 * @file streamiq.hpp
 * @brief Main header for streamiq - interactive queries over stream processing state
 *
 * Include this single header to access the full streamiq API.
 */

#include "streamiq/core/record.hpp"
#include "streamiq/core/queue.hpp"
#include "streamiq/core/errors.hpp"
#include "streamiq/core/config.hpp"
#include "streamiq/core/processor.hpp"
#include "streamiq/core/topology.hpp"
#include "streamiq/core/streams_instance.hpp"
#include "streamiq/core/engine.hpp"
#include "streamiq/core/metrics.hpp"

#include "streamiq/state/state_store.hpp"
#include "streamiq/state/key_value_store.hpp"
#include "streamiq/state/window_store.hpp"
#include "streamiq/state/session_store.hpp"
#include "streamiq/state/queryable_store_types.hpp"

#include "streamiq/cluster/host_info.hpp"
#include "streamiq/cluster/partitioner.hpp"
#include "streamiq/cluster/group_coordinator.hpp"

#include "streamiq/serialization/serializer.hpp"

#include "streamiq/processors/source.hpp"
#include "streamiq/processors/map.hpp"
#include "streamiq/processors/filter.hpp"
#include "streamiq/processors/aggregate.hpp"
#include "streamiq/processors/sink.hpp"

#include "streamiq/iq/streams_registry.hpp"
#include "streamiq/iq/interactive_query_service.hpp"

#include "streamiq/logging.hpp"

namespace streamiq {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace streamiq
