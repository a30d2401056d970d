/**
 * @file interactive_query_service.cpp
 * @brief Store lookup retry loop and host metadata queries
 */

#include "streamiq/iq/interactive_query_service.hpp"

#include <algorithm>
#include <thread>

#include "streamiq/logging.hpp"

namespace streamiq {

InteractiveQueryService::InteractiveQueryService(
    const StreamsRegistry& registry,
    BinderConfig config,
    Sleeper sleeper
)
    : registry_(registry)
    , config_(std::move(config))
    , sleeper_(std::move(sleeper)) {
    config_.state_store_retry.validate();
    if (!sleeper_) {
        sleeper_ = default_sleeper();
    }
}

Sleeper InteractiveQueryService::default_sleeper() {
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

std::shared_ptr<StateStore> InteractiveQueryService::locate_store(
    const std::string& store_name,
    StoreType type
) const {
    const auto& retry = config_.state_store_retry;
    std::string last_reason = "no streams instance registered";

    for (int attempt = 1; attempt <= retry.max_attempts; attempt++) {
        auto instances = registry_.instances();
        bool transient = instances.empty();

        for (auto* instance : instances) {
            auto result = instance->store(store_name, type);

            if (auto* store = std::get_if<std::shared_ptr<StateStore>>(&result)) {
                if (*store && (*store)->type() == type) {
                    return *store;
                }
                last_reason = "instance of " + instance->application_id()
                    + " returned a store of the wrong type";
                continue;
            }

            const auto& error = std::get<StoreLookupError>(result);
            last_reason = error.message;
            if (error.is_transient()) {
                transient = true;
            }
        }

        if (!transient) {
            throw StoreNotFoundError(store_name, last_reason);
        }

        STREAMIQ_DEBUG("state store {} unavailable (attempt {}/{}): {}",
            store_name, attempt, retry.max_attempts, last_reason);

        if (attempt < retry.max_attempts) {
            sleeper_(retry.backoff_for(attempt));
        }
    }

    STREAMIQ_WARN("giving up on state store {} after {} attempt(s)", store_name, retry.max_attempts);
    throw StoreRetriesExhaustedError(store_name, retry.max_attempts, last_reason);
}

HostInfo InteractiveQueryService::get_current_host_info() const {
    auto server = config_.application_server();
    if (!server) {
        throw ConfigError("application.server is not configured");
    }
    return HostInfo::parse(*server);
}

std::optional<HostInfo> InteractiveQueryService::host_for_key(
    const std::string& store_name,
    const Bytes& key
) const {
    for (auto* instance : registry_.instances()) {
        if (auto metadata = instance->metadata_for_key(store_name, key)) {
            return metadata->host_info;
        }
    }
    return std::nullopt;
}

std::vector<HostInfo> InteractiveQueryService::get_all_host_info(const std::string& store_name) const {
    std::vector<HostInfo> hosts;
    for (auto* instance : registry_.instances()) {
        for (const auto& metadata : instance->all_metadata_for_store(store_name)) {
            if (std::find(hosts.begin(), hosts.end(), metadata.host_info) == hosts.end()) {
                hosts.push_back(metadata.host_info);
            }
        }
    }
    return hosts;
}

} // namespace streamiq
