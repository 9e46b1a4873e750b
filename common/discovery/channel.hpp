#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace aranet {

// Many-producer, single-consumer queue. The channel is drained once every
// producer has called producer_done() and the queue is empty.
template<typename T>
class Channel {
public:
    explicit Channel(size_t producers) : producers_(producers) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void push(T value) {
        {
            std::lock_guard lock(mutex_);
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    void producer_done() {
        {
            std::lock_guard lock(mutex_);
            if (producers_ > 0) --producers_;
        }
        cv_.notify_all();
    }

    // Blocks until a value arrives or the channel is drained
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || producers_ == 0; });
        return take_locked();
    }

    // Like pop() but gives up after `timeout`
    std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || producers_ == 0; });
        return take_locked();
    }

    // Discard everything queued so far
    size_t clear() {
        std::lock_guard lock(mutex_);
        size_t dropped = queue_.size();
        queue_.clear();
        return dropped;
    }

    bool drained() const {
        std::lock_guard lock(mutex_);
        return queue_.empty() && producers_ == 0;
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    size_t producers_;
};

} // namespace aranet
