#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace todo {

/*
 * Blocking FIFO shared between the reactor (producer) and the
 * worker pool (consumers).
 */
template <typename T>
class WorkQueue {
public:
    // Reactor drops a parsed request off here
    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    // Blocks until an item is available.
    // Returns std::nullopt once stop is requested on the calling worker.
    std::optional<T> wait_and_pop(std::stop_token stop_token) {
        std::unique_lock lock(mutex_);
        bool ready = cv_.wait(lock, stop_token, [this]() {
            return !items_.empty();
        });

        if (!ready)
            return std::nullopt;

        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Drops everything still queued, returns how many were dropped
    size_t clear() {
        std::lock_guard lock(mutex_);
        size_t dropped = items_.size();
        items_.clear();
        return dropped;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        return size() == 0;
    }

private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

} // namespace todo
