/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

#include <cminer/pool/share.hpp>

namespace cminer::pool {

// Bounded multi-producer queue. Producers block while full (backpressure);
// shutdown() releases every blocked producer.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Returns false when the queue is shut down or still full after 'timeout'.
    template <typename Rep, typename Period>
    bool push_for(const T& value, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, timeout, [this]{ return shutdown_ || queue_.size() < capacity_; })) {
            return false;
        }
        if (shutdown_) return false;
        queue_.push_back(value);
        return true;
    }

    bool try_pop(T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return true;
    }

    // Returns the number of dropped entries.
    std::size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = queue_.size();
        queue_.clear();
        not_full_.notify_all();
        return n;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        not_full_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    std::condition_variable not_full_;
    std::size_t capacity_;
    bool shutdown_{false};
};

using ShareQueue = BoundedQueue<Share>;

} // namespace cminer::pool
