#pragma once

/**
 * @file queue.hpp
 * @brief Bounded, thread-safe record queue with backpressure
 */

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

#include "streamiq/core/record.hpp"

namespace streamiq {

struct QueueStats {
    std::uint64_t push_count{0};
    std::uint64_t pop_count{0};
    std::uint64_t push_blocked_count{0};
    std::size_t current_size{0};
    std::size_t capacity{0};
    std::size_t high_watermark{0};
};

/**
 * @brief Bounded MPMC queue of records
 *
 * Ring buffer sized at construction. Producers block while the queue
 * is full, which is how a slow processor throttles its upstream.
 */
class RecordQueue {
public:
    explicit RecordQueue(std::size_t capacity = 4096)
        : buffer_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RecordQueue capacity must be positive");
        }
    }

    RecordQueue(const RecordQueue&) = delete;
    RecordQueue& operator=(const RecordQueue&) = delete;

    /**
     * @brief Push a record, blocking while the queue is full
     * @return false if the queue was closed
     */
    bool push(Record record) {
        std::unique_lock<std::mutex> lock(mutex_);

        while (size_ == buffer_.size() && !closed_) {
            stats_.push_blocked_count++;
            not_full_.wait(lock);
        }
        if (closed_) {
            return false;
        }

        enqueue(std::move(record));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push without blocking
     * @return false if full or closed
     */
    bool try_push(Record record) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == buffer_.size() || closed_) {
            return false;
        }
        enqueue(std::move(record));
        not_empty_.notify_one();
        return true;
    }

    std::optional<Record> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == 0) {
            return std::nullopt;
        }
        auto record = dequeue();
        not_full_.notify_one();
        return record;
    }

    /**
     * @brief Pop with timeout
     * @return nullopt on timeout, or when closed and drained
     */
    template<typename Rep, typename Period>
    std::optional<Record> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] {
            return size_ > 0 || closed_;
        })) {
            return std::nullopt;
        }
        if (size_ == 0) {
            return std::nullopt;
        }
        auto record = dequeue();
        lock.unlock();
        not_full_.notify_one();
        return record;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_ == 0;
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return buffer_.size();
    }

    [[nodiscard]] QueueStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.current_size = size_;
        s.capacity = buffer_.size();
        return s;
    }

private:
    // Callers hold mutex_
    void enqueue(Record record) {
        buffer_[tail_] = std::move(record);
        tail_ = (tail_ + 1) % buffer_.size();
        size_++;
        stats_.push_count++;
        if (size_ > stats_.high_watermark) {
            stats_.high_watermark = size_;
        }
    }

    Record dequeue() {
        Record record = std::move(buffer_[head_]);
        head_ = (head_ + 1) % buffer_.size();
        size_--;
        stats_.pop_count++;
        return record;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;

    std::vector<Record> buffer_;
    std::size_t head_{0};
    std::size_t tail_{0};
    std::size_t size_{0};
    bool closed_{false};

    QueueStats stats_;
};

} // namespace streamiq
