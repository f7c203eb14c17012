#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace sn::queue {

// Bounded multi-producer multi-consumer queue guarded by one mutex.
// Producers never block; consumers block in pop() until an item arrives
// or close() is called, and drain what is left before failing.
template <typename T>
class BlockingQueue final {
public:
    explicit BlockingQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    [[nodiscard]] bool tryPush(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || items_.size() >= capacity_) return false;
        items_.push_back(std::move(value));
        notEmpty_.notify_one();
        return true;
    }

    // Blocks while empty and open
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return takeFront(out);
    }

    [[nodiscard]] bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeFront(out);
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        notEmpty_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    [[nodiscard]] bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size() >= capacity_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    // Caller holds the lock
    bool takeFront(T& out) {
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::deque<T> items_;
    const std::size_t capacity_;
    bool closed_{false};
};

} // namespace sn::queue
