#pragma once

/**
 * @file aggregate.hpp
 * @brief Counting processors backed by state stores
 */

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>

#include "streamiq/core/processor.hpp"
#include "streamiq/state/key_value_store.hpp"
#include "streamiq/state/session_store.hpp"
#include "streamiq/state/window_store.hpp"

namespace streamiq {

namespace detail {

inline std::int64_t count_of(const std::optional<Payload>& stored) {
    if (!stored) {
        return 0;
    }
    if (auto* value = std::get_if<std::int64_t>(&*stored)) {
        return *value;
    }
    return 0;
}

} // namespace detail

/**
 * @brief Counts records per key into a key-value store
 *
 * Forwards (key, new count). Records without a key are dropped.
 */
class CountProcessor : public Processor {
public:
    CountProcessor(std::string name, std::string store_name)
        : Processor(std::move(name))
        , store_name_(std::move(store_name)) {}

    void init(ProcessorContext& ctx) override {
        store_ = &ctx.state_store<KeyValueStore>(store_name_);
    }

    void process(Record& record, ProcessorContext& ctx) override {
        record_received();
        auto timer = time_processing();

        if (!record.has_key()) {
            record_dropped();
            return;
        }

        std::int64_t count = detail::count_of(store_->get(record.key())) + 1;
        store_->put(record.key(), count);

        ctx.forward(Record{record.key(), count, record.metadata()});
        record_forwarded();
    }

private:
    std::string store_name_;
    KeyValueStore* store_{nullptr};
};

/**
 * @brief Counts records per key in tumbling windows of event time
 *
 * Forwards (key, new count) with the record timestamp set to the
 * window start.
 */
class WindowedCountProcessor : public Processor {
public:
    WindowedCountProcessor(std::string name, std::string store_name, std::chrono::milliseconds window_size)
        : Processor(std::move(name))
        , store_name_(std::move(store_name))
        , window_size_ms_(window_size.count()) {
        if (window_size_ms_ <= 0) {
            throw std::invalid_argument("window size must be positive");
        }
    }

    void init(ProcessorContext& ctx) override {
        store_ = &ctx.state_store<WindowStore>(store_name_);
    }

    void process(Record& record, ProcessorContext& ctx) override {
        record_received();
        auto timer = time_processing();

        if (!record.has_key() || record.timestamp() < 0) {
            record_dropped();
            return;
        }

        Timestamp window_start = record.timestamp() - record.timestamp() % window_size_ms_;
        std::int64_t count = detail::count_of(store_->fetch(record.key(), window_start)) + 1;
        store_->put(record.key(), window_start, count);

        ctx.forward(Record{record.key(), count, RecordMetadata{window_start}});
        record_forwarded();
    }

    [[nodiscard]] std::int64_t window_size_ms() const noexcept { return window_size_ms_; }

private:
    std::string store_name_;
    std::int64_t window_size_ms_;
    WindowStore* store_{nullptr};
};

/**
 * @brief Counts records per key in sessions separated by inactivity gaps
 *
 * A record at time t joins every session of its key that ends within
 * gap before t or starts within gap after t; those sessions are merged
 * into one whose count is their sum plus one.
 */
class SessionCountProcessor : public Processor {
public:
    SessionCountProcessor(std::string name, std::string store_name, std::chrono::milliseconds inactivity_gap)
        : Processor(std::move(name))
        , store_name_(std::move(store_name))
        , gap_ms_(inactivity_gap.count()) {
        if (gap_ms_ < 0) {
            throw std::invalid_argument("inactivity gap must not be negative");
        }
    }

    void init(ProcessorContext& ctx) override {
        store_ = &ctx.state_store<SessionStore>(store_name_);
    }

    void process(Record& record, ProcessorContext& ctx) override {
        record_received();
        auto timer = time_processing();

        if (!record.has_key()) {
            record_dropped();
            return;
        }

        const Timestamp t = record.timestamp();
        SessionWindow merged{t, t};
        std::int64_t count = 1;

        for (const auto& session : store_->find_sessions(record.key(), t - gap_ms_, t + gap_ms_)) {
            merged.start = std::min(merged.start, session.window.start);
            merged.end = std::max(merged.end, session.window.end);
            count += detail::count_of(session.value);
            store_->remove(record.key(), session.window);
        }
        store_->put(record.key(), merged, count);

        ctx.forward(Record{record.key(), count, RecordMetadata{merged.end}});
        record_forwarded();
    }

private:
    std::string store_name_;
    std::int64_t gap_ms_;
    SessionStore* store_{nullptr};
};

} // namespace streamiq
