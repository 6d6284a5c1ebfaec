#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>

template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;
    ~ThreadSafeQueue() = default;

    // Returns false once the queue is closed, the element is not stored then.
    template<typename U>
    bool push(U&& item) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_closed.load(std::memory_order_acquire)) {
            return false;
        }
        _queue.emplace(std::forward<U>(item));
        _cv.notify_one();
        return true;
    }

    // Blocks until an element is available. After close() the remaining
    // elements are still handed out, then pop() returns false.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [&]() {
            return !_queue.empty() || _closed.load(std::memory_order_acquire);
            });
        if (!_queue.empty()) {
            out = std::move(_queue.front());
            _queue.pop();
            return true;
        }
        return false;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _queue.empty();
    }

    void close() {
        std::lock_guard<std::mutex> lock(_mutex);
        _closed.store(true, std::memory_order_release);
        _cv.notify_all();
    }

    bool closed() const {
        return _closed.load(std::memory_order_acquire);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _queue.size();
    }

private:
    std::queue<T> _queue;
    mutable std::mutex _mutex;
    mutable std::condition_variable _cv;
    std::atomic<bool> _closed{ false };
};
