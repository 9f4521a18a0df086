#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>

namespace infstore::pipeline {

// Multi-producer, multi-consumer FIFO with a fixed capacity. push blocks while the
// queue is full and pop blocks while it is empty. After close() pushes fail and pops
// keep returning the remaining items until the queue is drained.
template <typename T>
class BoundedBlockingQueue {
  public:
    explicit BoundedBlockingQueue(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("Queue capacity must be greater than zero");
        }
    }

    BoundedBlockingQueue(const BoundedBlockingQueue &) = delete;
    BoundedBlockingQueue &operator=(const BoundedBlockingQueue &) = delete;

    bool push(T &&value) {
        std::unique_lock lock(mutex_);
        notFull_.wait(lock, [&] { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push(std::move(value));
        ++pushed_;
        notEmpty_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        notEmpty_.wait(lock, [&] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop();
        notFull_.notify_one();
        return value;
    }

    void close() {
        {
            std::scoped_lock lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::scoped_lock lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::uint64_t pushedTotal() const {
        std::scoped_lock lock(mutex_);
        return pushed_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

  private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::queue<T> queue_;
    std::uint64_t pushed_{0};
    bool closed_{false};
};

}  // namespace infstore::pipeline
