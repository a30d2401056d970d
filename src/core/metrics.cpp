/**
 * @file metrics.cpp
 * @brief Binder-level instance metrics
 */

#include "streamiq/core/metrics.hpp"

#include <sstream>

namespace streamiq {

void StreamsBinderMetrics::bind_instance(StreamsInstance& instance) {
    Entry* entry = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(std::make_unique<Entry>(instance.application_id()));
        entry = entries_.back().get();
    }
    registered_.increment();

    auto subscribed_at = instance.add_state_listener([this, entry](StreamsState new_state, StreamsState old_state) {
        on_transition(*entry, new_state, old_state);
    });

    // A transition may have reached the listener before this point; it
    // recorded the newer state, which wins over subscribed_at.
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->transitions.value() == 0) {
        entry->state.store(subscribed_at);
    }
    if (entry->state.load() == StreamsState::Running) {
        running_.increment();
    }
    entry->bound = true;
}

void StreamsBinderMetrics::on_transition(Entry& entry, StreamsState new_state, StreamsState old_state) {
    std::lock_guard<std::mutex> lock(entry.mutex);
    entry.state.store(new_state);
    entry.transitions.increment();
    transitions_.increment();

    // Until bound, bind_instance accounts for the latest state itself
    if (!entry.bound) {
        return;
    }
    if (new_state == StreamsState::Running && old_state != StreamsState::Running) {
        running_.increment();
    } else if (old_state == StreamsState::Running && new_state != StreamsState::Running) {
        running_.decrement();
    }
}

std::vector<InstanceMetrics> StreamsBinderMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InstanceMetrics> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back({entry->application_id, entry->state.load(), entry->transitions.value()});
    }
    return result;
}

std::string StreamsBinderMetrics::format() const {
    std::ostringstream oss;
    oss << "Instances: " << registered_.value()
        << " | Running: " << running_.value()
        << " | Transitions: " << transitions_.value();
    for (const auto& instance : snapshot()) {
        oss << " | " << instance.application_id << "=" << to_string(instance.state);
    }
    return oss.str();
}

} // namespace streamiq
