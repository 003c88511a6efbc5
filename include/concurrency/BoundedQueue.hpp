#pragma once

#include "concurrency/Context.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace wh::concurrency {

struct QueueClosed : std::runtime_error {
    QueueClosed() : std::runtime_error("[BoundedQueue] Push on a closed queue") {}
};

// Fixed-capacity FIFO with blocking backpressure on both ends. Waits that take a
// Context wake up as soon as it is cancelled; the queue must outlive those waits.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(const std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            notFull_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) throw QueueClosed();
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
    }

    // false if ctx was cancelled before there was room
    bool push(T item, Context& ctx) {
        const auto id = ctx.onCancel([this] { wake(); });
        {
            std::unique_lock lock(mutex_);
            notFull_.wait(lock, [&] { return closed_ || ctx.isCancelled() || items_.size() < capacity_; });
            if (closed_) {
                lock.unlock();
                ctx.removeCallback(id);
                throw QueueClosed();
            }
            if (ctx.isCancelled()) {
                lock.unlock();
                ctx.removeCallback(id);
                return false;
            }
            items_.push_back(std::move(item));
        }
        ctx.removeCallback(id);
        notEmpty_.notify_one();
        return true;
    }

    bool tryPush(T item) {
        {
            std::scoped_lock lock(mutex_);
            if (closed_ || items_.size() >= capacity_) return false;
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
    }

    // Blocks until an item arrives, ctx is cancelled, or the queue is closed and
    // drained. Cancellation wins over pending items.
    std::optional<T> pop(Context& ctx) {
        const auto id = ctx.onCancel([this] { wake(); });
        std::optional<T> item;
        {
            std::unique_lock lock(mutex_);
            notEmpty_.wait(lock, [&] { return ctx.isCancelled() || closed_ || !items_.empty(); });
            if (!ctx.isCancelled() && !items_.empty()) {
                item.emplace(std::move(items_.front()));
                items_.pop_front();
            }
        }
        ctx.removeCallback(id);
        if (item) notFull_.notify_one();
        return item;
    }

    std::optional<T> tryPop() {
        std::optional<T> item;
        {
            std::scoped_lock lock(mutex_);
            if (items_.empty()) return std::nullopt;
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        notFull_.notify_one();
        return item;
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
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
    void wake() {
        // taking the lock orders the notification after a waiter's predicate check
        { std::scoped_lock lock(mutex_); }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_, notFull_;
    std::deque<T> items_;
    bool closed_{false};
};

}
