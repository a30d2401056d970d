#pragma once

/**
 * @file window_store.hpp
 * @brief In-memory window store and its read-only query handle
 */

#include <algorithm>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "streamiq/core/record.hpp"
#include "streamiq/state/state_store.hpp"

namespace streamiq {

struct WindowedValue {
    Timestamp window_start;
    Payload value;
};

struct WindowedEntry {
    Payload key;
    Timestamp window_start;
    Payload value;
};

/**
 * @brief Store of (key, window start) -> value
 *
 * Entries are kept in one segment per window start so expiry is a
 * prefix erase. Windows older than the retention period, measured
 * against the latest window seen, are dropped on put.
 */
class WindowStore : public StateStore {
public:
    WindowStore(std::string name, std::chrono::milliseconds retention)
        : StateStore(std::move(name))
        , retention_ms_(retention.count()) {}

    [[nodiscard]] StoreType type() const noexcept override { return StoreType::Window; }

    void put(const Payload& key, Timestamp window_start, Payload value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        observed_time_ = std::max(observed_time_, window_start);
        auto cutoff = observed_time_ - retention_ms_;
        if (window_start < cutoff) {
            return;
        }
        segments_[window_start][key] = std::move(value);
        segments_.erase(segments_.begin(), segments_.lower_bound(cutoff));
    }

    [[nodiscard]] std::optional<Payload> fetch(const Payload& key, Timestamp window_start) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto segment = segments_.find(window_start);
        if (segment == segments_.end()) {
            return std::nullopt;
        }
        auto it = segment->second.find(key);
        if (it == segment->second.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Windows of a key starting within [time_from, time_to]
     */
    [[nodiscard]] std::vector<WindowedValue> fetch(
        const Payload& key,
        Timestamp time_from,
        Timestamp time_to
    ) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<WindowedValue> result;
        if (time_to < time_from) {
            return result;
        }
        auto end = segments_.upper_bound(time_to);
        for (auto segment = segments_.lower_bound(time_from); segment != end; ++segment) {
            auto it = segment->second.find(key);
            if (it != segment->second.end()) {
                result.push_back({segment->first, it->second});
            }
        }
        return result;
    }

    [[nodiscard]] std::vector<WindowedEntry> fetch_all(Timestamp time_from, Timestamp time_to) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<WindowedEntry> result;
        if (time_to < time_from) {
            return result;
        }
        auto end = segments_.upper_bound(time_to);
        for (auto segment = segments_.lower_bound(time_from); segment != end; ++segment) {
            for (const auto& [key, value] : segment->second) {
                result.push_back({key, segment->first, value});
            }
        }
        return result;
    }

    void clear() override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        segments_.clear();
        observed_time_ = std::numeric_limits<Timestamp>::min() / 2;
    }

private:
    mutable std::shared_mutex mutex_;
    std::int64_t retention_ms_;
    Timestamp observed_time_{std::numeric_limits<Timestamp>::min() / 2};
    std::map<Timestamp, std::map<Payload, Payload>> segments_;
};

class ReadOnlyWindowStore {
public:
    using store_type = WindowStore;

    explicit ReadOnlyWindowStore(std::shared_ptr<WindowStore> store)
        : store_(std::move(store)) {}

    [[nodiscard]] std::optional<Payload> fetch(const Payload& key, Timestamp window_start) const {
        store_->ensure_open();
        return store_->fetch(key, window_start);
    }

    [[nodiscard]] std::vector<WindowedValue> fetch(
        const Payload& key,
        Timestamp time_from,
        Timestamp time_to
    ) const {
        store_->ensure_open();
        return store_->fetch(key, time_from, time_to);
    }

    [[nodiscard]] std::vector<WindowedEntry> fetch_all(Timestamp time_from, Timestamp time_to) const {
        store_->ensure_open();
        return store_->fetch_all(time_from, time_to);
    }

    [[nodiscard]] const std::string& name() const noexcept { return store_->name(); }

private:
    std::shared_ptr<WindowStore> store_;
};

} // namespace streamiq
