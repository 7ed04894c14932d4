#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>

namespace gdfs::concurrency {

// FIFO with a fixed capacity. push() blocks while full, pop() blocks while empty.
// After close() pushes are rejected and pop() drains what is left, then returns nullopt.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(const size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("BoundedQueue capacity must be positive");
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false when the queue was closed before the item could be accepted.
    bool push(T item) {
        std::unique_lock lock(mutex_);
        notFull_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push(std::move(item));
        ++pushed_;
        notEmpty_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop();
        notFull_.notify_one();
        return item;
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

    [[nodiscard]] size_t capacity() const { return capacity_; }

    [[nodiscard]] size_t totalPushed() const {
        std::scoped_lock lock(mutex_);
        return pushed_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notFull_, notEmpty_;
    std::queue<T> queue_;
    size_t pushed_ = 0;
    bool closed_ = false;
};

}
