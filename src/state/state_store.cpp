/**
 * @file state_store.cpp
 * @brief Store factory and enum names
 */

#include "streamiq/state/state_store.hpp"

#include "streamiq/state/key_value_store.hpp"
#include "streamiq/state/session_store.hpp"
#include "streamiq/state/window_store.hpp"

namespace streamiq {

const char* to_string(StoreType type) noexcept {
    switch (type) {
        case StoreType::KeyValue: return "key-value";
        case StoreType::Window:   return "window";
        case StoreType::Session:  return "session";
    }
    return "unknown";
}

const char* to_string(StoreState state) noexcept {
    switch (state) {
        case StoreState::Restoring: return "RESTORING";
        case StoreState::Running:   return "RUNNING";
        case StoreState::Closed:    return "CLOSED";
    }
    return "UNKNOWN";
}

std::shared_ptr<StateStore> make_store(const StoreDescriptor& descriptor) {
    switch (descriptor.type) {
        case StoreType::KeyValue:
            return std::make_shared<KeyValueStore>(descriptor.name);
        case StoreType::Window:
            return std::make_shared<WindowStore>(descriptor.name, descriptor.retention);
        case StoreType::Session:
            return std::make_shared<SessionStore>(descriptor.name, descriptor.retention);
    }
    throw std::invalid_argument("Unsupported store type for '" + descriptor.name + "'");
}

} // namespace streamiq
