/*
 * LanChat - bounded blocking queue
 *
 * Backs every producer/consumer stream in the node: discovery sightings,
 * per-connection outbound frames and the merged inbound message stream.
 * close() wakes every waiter; consumers keep draining what was queued
 * before the close and then see std::nullopt.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace lanchat {

enum class PushResult {
    Ok,
    Full,
    Closed
};

template <typename T>
class BlockingQueue {
public:
    // capacity 0 means unbounded.
    explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || has_room(); });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    PushResult push_for(T item, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, timeout, [this] { return closed_ || has_room(); })) {
            return PushResult::Full;
        }
        if (closed_) {
            return PushResult::Closed;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return PushResult::Ok;
    }

    // Same as push_for, but item is moved from only when it was queued.
    PushResult offer_for(T& item, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, timeout, [this] { return closed_ || has_room(); })) {
            return PushResult::Full;
        }
        if (closed_) {
            return PushResult::Closed;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return PushResult::Ok;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take_front();
    }

    std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return take_front();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // Removes and returns everything still queued.
    std::vector<T> drain() {
        std::vector<T> drained;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            drained.reserve(items_.size());
            for (auto& item : items_) {
                drained.push_back(std::move(item));
            }
            items_.clear();
        }
        not_full_.notify_all();
        return drained;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    bool has_room() const {
        return capacity_ == 0 || items_.size() < capacity_;
    }

    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace lanchat
