#pragma once

/**
 * @file key_value_store.hpp
 * @brief In-memory key-value store and its read-only query handle
 */

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "streamiq/core/record.hpp"
#include "streamiq/state/state_store.hpp"

namespace streamiq {

using KeyValue = std::pair<Payload, Payload>;

/**
 * @brief Ordered in-memory key-value store
 *
 * Written by processors on stream threads, read concurrently by
 * query threads.
 */
class KeyValueStore : public StateStore {
public:
    using StateStore::StateStore;

    [[nodiscard]] StoreType type() const noexcept override { return StoreType::KeyValue; }

    void put(const Payload& key, Payload value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        data_[key] = std::move(value);
    }

    /**
     * @brief Insert only if the key is absent
     * @return The existing value if there was one
     */
    std::optional<Payload> put_if_absent(const Payload& key, Payload value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = data_.try_emplace(key, std::move(value));
        if (inserted) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::optional<Payload> get(const Payload& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<Payload> remove(const Payload& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        auto old = std::move(it->second);
        data_.erase(it);
        return old;
    }

    /**
     * @brief Entries with from <= key <= to, in key order
     */
    [[nodiscard]] std::vector<KeyValue> range(const Payload& from, const Payload& to) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<KeyValue> result;
        if (to < from) {
            return result;
        }
        auto end = data_.upper_bound(to);
        for (auto it = data_.lower_bound(from); it != end; ++it) {
            result.emplace_back(it->first, it->second);
        }
        return result;
    }

    [[nodiscard]] std::vector<KeyValue> all() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return std::vector<KeyValue>(data_.begin(), data_.end());
    }

    [[nodiscard]] std::size_t approximate_num_entries() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return data_.size();
    }

    void clear() override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        data_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<Payload, Payload> data_;
};

/**
 * @brief Query-side view of a key-value store
 *
 * Every read re-checks that the store is still serving.
 */
class ReadOnlyKeyValueStore {
public:
    using store_type = KeyValueStore;

    explicit ReadOnlyKeyValueStore(std::shared_ptr<KeyValueStore> store)
        : store_(std::move(store)) {}

    [[nodiscard]] std::optional<Payload> get(const Payload& key) const {
        store_->ensure_open();
        return store_->get(key);
    }

    [[nodiscard]] std::vector<KeyValue> range(const Payload& from, const Payload& to) const {
        store_->ensure_open();
        return store_->range(from, to);
    }

    [[nodiscard]] std::vector<KeyValue> all() const {
        store_->ensure_open();
        return store_->all();
    }

    [[nodiscard]] std::size_t approximate_num_entries() const {
        store_->ensure_open();
        return store_->approximate_num_entries();
    }

    [[nodiscard]] const std::string& name() const noexcept { return store_->name(); }

private:
    std::shared_ptr<KeyValueStore> store_;
};

} // namespace streamiq
