#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace fixcap::core {

// Thread-safe FIFO. A non-zero capacity turns it into a ring: pushing into a
// full queue drops the oldest element.
template <typename T>
class Queue {
public:
    Queue() = default;
    explicit Queue(size_t capacity) : capacity_(capacity) {}

    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (capacity_ != 0 && queue_.size() >= capacity_) {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(value));
        }
        cond_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    bool wait_and_pop(T& value, std::stop_token stoken) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool has_value = cond_.wait(lock, stoken, [this] { return !queue_.empty(); });

        if (!has_value) {
            return false;  // Stopped without getting a value
        }

        value = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    template <typename Rep, typename Period>
    bool wait_and_pop_for(T& value, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return false;
        }
        value = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Runs fn while holding the queue lock, after discarding every element
    template <typename Fn>
    void clear_and(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        fn();
    }

    void clear() {
        clear_and([] {});
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    std::condition_variable_any cond_;
    size_t capacity_{0};
    size_t dropped_{0};
};

} // namespace fixcap::core
