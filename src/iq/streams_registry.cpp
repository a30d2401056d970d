/**
 * @file streams_registry.cpp
 * @brief Engine instance registration
 */

#include "streamiq/iq/streams_registry.hpp"

#include <algorithm>
#include <mutex>

#include "streamiq/logging.hpp"

namespace streamiq {

void StreamsRegistry::register_instance(StreamsInstance& instance) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (std::find(instances_.begin(), instances_.end(), &instance) != instances_.end()) {
            return;
        }
        instances_.push_back(&instance);
    }
    STREAMIQ_DEBUG("registered streams instance for {}", instance.application_id());

    // Outside the lock: bind_instance installs a state listener on the engine
    if (metrics_) {
        metrics_->bind_instance(instance);
    }
}

bool StreamsRegistry::unregister_instance(StreamsInstance& instance) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find(instances_.begin(), instances_.end(), &instance);
    if (it == instances_.end()) {
        return false;
    }
    instances_.erase(it);
    return true;
}

std::vector<StreamsInstance*> StreamsRegistry::instances() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return instances_;
}

std::size_t StreamsRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return instances_.size();
}

} // namespace streamiq
