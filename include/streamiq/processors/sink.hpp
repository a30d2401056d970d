#pragma once

/**
 * @file sink.hpp
 * @brief Sink processors
 */

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

#include "streamiq/core/processor.hpp"
#include "streamiq/logging.hpp"

namespace streamiq {

/**
 * @brief Keeps every consumed record in memory
 */
class CollectingSink : public SinkProcessor {
public:
    using SinkProcessor::SinkProcessor;

    void consume(const Record& record) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back(record);
        }
        cv_.notify_all();
    }

    [[nodiscard]] std::vector<Record> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] std::size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    /**
     * @brief Wait until at least n records were consumed
     * @return false on timeout
     */
    bool wait_for(std::size_t n, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return records_.size() >= n; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<Record> records_;
};

/**
 * @brief Logs each record at debug level
 */
class LoggingSink : public SinkProcessor {
public:
    using SinkProcessor::SinkProcessor;

    void consume(const Record& record) override {
        STREAMIQ_DEBUG("{}: {} -> {}", name(), to_string(record.key()), to_string(record.value()));
    }
};

/**
 * @brief Calls a function for each record
 */
template<typename Func>
class FunctionSink : public SinkProcessor {
public:
    FunctionSink(std::string name, Func func)
        : SinkProcessor(std::move(name))
        , func_(std::move(func)) {}

    void consume(const Record& record) override {
        func_(record);
    }

private:
    Func func_;
};

template<typename Func>
auto make_sink(std::string name, Func&& func) {
    return std::make_unique<FunctionSink<std::decay_t<Func>>>(
        std::move(name), std::forward<Func>(func)
    );
}

} // namespace streamiq
