#pragma once

/**
 * @file queryable_store_types.hpp
 * @brief Tags selecting which kind of store a query expects
 */

#include <memory>

#include "streamiq/state/key_value_store.hpp"
#include "streamiq/state/session_store.hpp"
#include "streamiq/state/state_store.hpp"
#include "streamiq/state/window_store.hpp"

namespace streamiq {

/**
 * @brief Binds a store type to the read-only handle a query receives
 *
 * create() must only be handed a store whose type() equals store_type;
 * the engine checks this before returning a store.
 */
template<typename Handle, StoreType Type>
struct QueryableStoreType {
    using handle_type = Handle;

    [[nodiscard]] constexpr StoreType store_type() const noexcept { return Type; }

    [[nodiscard]] handle_type create(std::shared_ptr<StateStore> store) const {
        return handle_type(std::static_pointer_cast<typename Handle::store_type>(std::move(store)));
    }
};

using KeyValueStoreType = QueryableStoreType<ReadOnlyKeyValueStore, StoreType::KeyValue>;
using WindowStoreType = QueryableStoreType<ReadOnlyWindowStore, StoreType::Window>;
using SessionStoreType = QueryableStoreType<ReadOnlySessionStore, StoreType::Session>;

namespace queryable_store_types {

inline KeyValueStoreType key_value_store() { return {}; }
inline WindowStoreType window_store() { return {}; }
inline SessionStoreType session_store() { return {}; }

} // namespace queryable_store_types

} // namespace streamiq
