#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace vcast {

// Bounded FIFO that never blocks the producer:
// when full, the oldest item is evicted to make room for the new one.
template<typename T>
class DropOldestQueue {
public:
    explicit DropOldestQueue(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    DropOldestQueue(const DropOldestQueue&) = delete;
    DropOldestQueue& operator=(const DropOldestQueue&) = delete;

    // Returns the number of evicted items (0 or 1). Ignored after close().
    std::size_t push(T v) {
        std::size_t evicted = 0;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return 0;
            evicted = push_locked(std::move(v));
        }
        cv_.notify_one();
        return evicted;
    }

    // Push only if newer(v, back) holds for the most recent queued item
    // (or the queue is empty). Check and push happen under one lock.
    template<typename Func>
    bool push_if(T v, Func newer, std::size_t* evicted = nullptr) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return false;
            if (!q_.empty() && !newer(v, q_.back())) return false;
            std::size_t n = push_locked(std::move(v));
            if (evicted) *evicted = n;
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (q_.empty()) return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    // Wait up to `timeout` for an item. Returns nullopt on timeout or close.
    std::optional<T> pop_wait(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, timeout, [&]{ return closed_ || !q_.empty(); });
        if (q_.empty()) return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    // Drops pending items and rejects further pushes; wakes waiters.
    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
            q_.clear();
        }
        cv_.notify_all();
    }

    void clear() {
        std::lock_guard<std::mutex> lk(mtx_);
        q_.clear();
    }

    // Copy of the pending items, oldest first.
    std::vector<T> items() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return std::vector<T>(q_.begin(), q_.end());
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return q_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    std::size_t capacity() const { return capacity_; }

    uint64_t dropped() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return dropped_;
    }

private:
    std::size_t push_locked(T v) {
        std::size_t evicted = 0;
        while (q_.size() >= capacity_) {
            q_.pop_front();
            ++evicted;
        }
        dropped_ += evicted;
        q_.push_back(std::move(v));
        return evicted;
    }

    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> q_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace vcast
