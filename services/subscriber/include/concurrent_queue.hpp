#pragma once
#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <utility>
#include <cstddef>

#include "job.hpp"

// Unbounded multi-producer/multi-consumer FIFO. pop() blocks until an item
// is available or the queue is closed and drained.
template <typename T>
class ConcurrentQueue {
public:
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [&]{ return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Consumers keep receiving queued items, then pop() returns nullopt.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::size_t clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        std::size_t dropped = items_.size();
        items_.clear();
        return dropped;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_{false};
};

using JobQueue = ConcurrentQueue<Job>;
using NotificationQueue = ConcurrentQueue<Notification>;
