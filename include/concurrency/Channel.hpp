#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace cs::concurrency {

// Bounded multi-producer, multi-consumer queue. send() blocks while the
// channel is full; receive() blocks while it is empty. After close(),
// senders fail immediately and receivers drain what is left.
template <typename T>
class Channel {
public:
    explicit Channel(const size_t capacity) : capacity_(capacity ? capacity : 1) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // false when the channel was closed before v could be queued
    bool send(T v) {
        {
            std::unique_lock lock(mutex_);
            notFull_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
            if (closed_) return false;
            queue_.push(std::move(v));
        }
        notEmpty_.notify_one();
        return true;
    }

    // nullopt once the channel is closed and drained
    std::optional<T> receive() {
        std::optional<T> v;
        {
            std::unique_lock lock(mutex_);
            notEmpty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) return std::nullopt;
            v.emplace(std::move(queue_.front()));
            queue_.pop();
        }
        notFull_.notify_one();
        return v;
    }

    void close() {
        {
            std::scoped_lock lock(mutex_);
            closed_ = true;
        }
        notFull_.notify_all();
        notEmpty_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    const size_t capacity_;
    bool closed_ = false;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable notFull_;
    std::condition_variable notEmpty_;
};

}
