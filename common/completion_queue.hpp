#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

// Multi-producer queue handing results to one consumer in the order they were pushed.
// Items are kept until the queue is destroyed; with the capacity reserved up
// front, push never allocates.
template<typename T>
class CompletionQueue {
public:
    explicit CompletionQueue(size_t capacity = 0) {
        items_.reserve(capacity);
    }

    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    // blocks until an item is available
    T pop() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this]() { return head_ < items_.size(); });
        return std::move(items_[head_++]);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size() - head_;
    }

    size_t capacity() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.capacity();
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<T> items_;
    size_t head_ = 0;
};
