#pragma once

/**
 * @file session_store.hpp
 * @brief In-memory session store and its read-only query handle
 */

#include <algorithm>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <tuple>
#include <vector>

#include "streamiq/core/record.hpp"
#include "streamiq/state/state_store.hpp"

namespace streamiq {

/**
 * @brief Closed interval [start, end] of activity for one key
 */
struct SessionWindow {
    Timestamp start;
    Timestamp end;

    bool operator==(const SessionWindow& other) const noexcept {
        return start == other.start && end == other.end;
    }
};

struct SessionEntry {
    Payload key;
    SessionWindow window;
    Payload value;
};

/**
 * @brief Store of (key, session window) -> value
 */
class SessionStore : public StateStore {
public:
    SessionStore(std::string name, std::chrono::milliseconds retention)
        : StateStore(std::move(name))
        , retention_ms_(retention.count()) {}

    [[nodiscard]] StoreType type() const noexcept override { return StoreType::Session; }

    void put(const Payload& key, SessionWindow window, Payload value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        observed_time_ = std::max(observed_time_, window.end);
        if (window.end < observed_time_ - retention_ms_) {
            return;
        }
        sessions_[make_key(key, window)] = std::move(value);
    }

    void remove(const Payload& key, SessionWindow window) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        sessions_.erase(make_key(key, window));
    }

    /**
     * @brief Sessions of a key that end at or after earliest_end and
     * start at or before latest_start
     *
     * With earliest_end = t - gap and latest_start = t + gap this returns
     * every session a record at time t has to merge with.
     */
    [[nodiscard]] std::vector<SessionEntry> find_sessions(
        const Payload& key,
        Timestamp earliest_end,
        Timestamp latest_start
    ) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<SessionEntry> result;
        auto it = sessions_.lower_bound({key, earliest_end, std::numeric_limits<Timestamp>::min()});
        for (; it != sessions_.end() && std::get<0>(it->first) == key; ++it) {
            const auto& [k, end, start] = it->first;
            if (start <= latest_start) {
                result.push_back({k, {start, end}, it->second});
            }
        }
        return result;
    }

    [[nodiscard]] std::vector<SessionEntry> fetch(const Payload& key) const {
        return find_sessions(key,
            std::numeric_limits<Timestamp>::min(),
            std::numeric_limits<Timestamp>::max());
    }

    [[nodiscard]] std::vector<SessionEntry> all() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<SessionEntry> result;
        result.reserve(sessions_.size());
        for (const auto& [k, value] : sessions_) {
            const auto& [key, end, start] = k;
            result.push_back({key, {start, end}, value});
        }
        return result;
    }

    void clear() override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        sessions_.clear();
        observed_time_ = std::numeric_limits<Timestamp>::min() / 2;
    }

private:
    // Ordered by end time within a key so find_sessions can seek
    using SessionKey = std::tuple<Payload, Timestamp, Timestamp>;

    static SessionKey make_key(const Payload& key, SessionWindow window) {
        return {key, window.end, window.start};
    }

    mutable std::shared_mutex mutex_;
    std::int64_t retention_ms_;
    Timestamp observed_time_{std::numeric_limits<Timestamp>::min() / 2};
    std::map<SessionKey, Payload> sessions_;
};

class ReadOnlySessionStore {
public:
    using store_type = SessionStore;

    explicit ReadOnlySessionStore(std::shared_ptr<SessionStore> store)
        : store_(std::move(store)) {}

    [[nodiscard]] std::vector<SessionEntry> fetch(const Payload& key) const {
        store_->ensure_open();
        return store_->fetch(key);
    }

    [[nodiscard]] std::vector<SessionEntry> all() const {
        store_->ensure_open();
        return store_->all();
    }

    [[nodiscard]] const std::string& name() const noexcept { return store_->name(); }

private:
    std::shared_ptr<SessionStore> store_;
};

} // namespace streamiq
