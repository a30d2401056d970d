#pragma once

/**
 * @file source.hpp
 * @brief Source processors
 */

#include <chrono>
#include <limits>
#include <memory>
#include <optional>
#include <thread>

#include "streamiq/core/processor.hpp"

namespace streamiq {

/**
 * @brief Input channel fed by application code, read by a FeedSource
 *
 * Stands in for an input topic: send() blocks while the feed is full.
 */
class RecordFeed {
public:
    explicit RecordFeed(std::size_t capacity = 4096)
        : queue_(capacity) {}

    /**
     * @return false if the feed was closed
     */
    bool send(Record record) {
        return queue_.push(std::move(record));
    }

    bool send(Payload key, Payload value) {
        return send(Record{std::move(key), std::move(value)});
    }

    void close() { queue_.close(); }

    [[nodiscard]] bool is_closed() const { return queue_.is_closed(); }
    [[nodiscard]] std::size_t pending() const { return queue_.size(); }

    template<typename Rep, typename Period>
    std::optional<Record> poll(std::chrono::duration<Rep, Period> timeout) {
        return queue_.pop_for(timeout);
    }

    [[nodiscard]] bool exhausted() const {
        return queue_.is_closed() && queue_.empty();
    }

private:
    RecordQueue queue_;
};

/**
 * @brief Forwards every record sent to a RecordFeed
 *
 * Exhausted once the feed is closed and drained.
 */
class FeedSource : public SourceProcessor {
public:
    FeedSource(std::string name, std::shared_ptr<RecordFeed> feed)
        : SourceProcessor(std::move(name))
        , feed_(std::move(feed)) {}

    bool generate(ProcessorContext& ctx) override {
        if (should_stop()) {
            return false;
        }

        auto record = feed_->poll(std::chrono::milliseconds(50));
        if (!record) {
            return !feed_->exhausted();
        }

        record_received();
        if (ctx.forward(*record) > 0) {
            record_forwarded();
        } else {
            record_dropped();
        }
        return true;
    }

private:
    std::shared_ptr<RecordFeed> feed_;
};

/**
 * @brief Generates keyed integer records start, start+1, ...
 *
 * Keys cycle through 0..key_modulo-1, or equal the value when
 * key_modulo is 0.
 */
class SequenceSource : public SourceProcessor {
public:
    struct Config {
        std::int64_t start{0};
        std::uint64_t count{std::numeric_limits<std::uint64_t>::max()};
        std::int64_t key_modulo{0};
        std::chrono::microseconds delay{0};
    };

    explicit SequenceSource(std::string name)
        : SequenceSource(std::move(name), Config()) {}

    SequenceSource(std::string name, Config config)
        : SourceProcessor(std::move(name))
        , config_(config)
        , current_(config.start) {}

    bool generate(ProcessorContext& ctx) override {
        if (should_stop() || generated_ >= config_.count) {
            return false;
        }

        std::int64_t key = config_.key_modulo > 0 ? current_ % config_.key_modulo : current_;
        if (ctx.forward(Record{key, current_}) > 0) {
            record_forwarded();
        } else {
            record_dropped();
        }
        current_++;
        generated_++;

        if (config_.delay.count() > 0) {
            std::this_thread::sleep_for(config_.delay);
        }
        return true;
    }

    [[nodiscard]] std::uint64_t generated() const noexcept { return generated_; }

private:
    Config config_;
    std::int64_t current_;
    std::uint64_t generated_{0};
};

} // namespace streamiq
