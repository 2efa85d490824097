#pragma once

/**
 * @file messagequeue.hpp
 * @brief Bounded blocking queue connecting two pipeline stages.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include "common.hpp"

/*
 * push() blocks while the queue is full, pop() blocks while it is empty.
 * After close(), push() fails at once and pop() drains what is left,
 * then returns an empty optional. Every blocking point in the stack
 * is one of these two calls, so closing the queues is the shutdown path.
 */
template<typename T>
class messagequeue {
public:
    explicit messagequeue(std::size_t capacity = QUEUE_CAPACITY)
        : capacity(capacity ? capacity : 1), is_closed(false) {}

    messagequeue(const messagequeue &) = delete;
    messagequeue &operator = (const messagequeue &) = delete;

    /**
     * @brief Append an item, waiting for room.
     * @return false if the queue was closed; the item is dropped.
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex);
        cond_not_full.wait(lock, [this] { return is_closed || q.size() < capacity; });
        if(is_closed) return false;
        q.push_back(std::move(item));
        cond_not_empty.notify_one();
        return true;
    }

    /**
     * @brief Take the oldest item, waiting for one to arrive.
     * @return empty once the queue is closed and drained.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex);
        cond_not_empty.wait(lock, [this] { return is_closed || !q.empty(); });
        return take();
    }

    // like pop(), but gives up after timeout.
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        cond_not_empty.wait_for(lock, timeout, [this] { return is_closed || !q.empty(); });
        return take();
    }

    void close() {
        std::scoped_lock lock(mutex);
        is_closed = true;
        cond_not_full.notify_all();
        cond_not_empty.notify_all();
    }

    bool closed() const {
        std::scoped_lock lock(mutex);
        return is_closed;
    }

    std::size_t size() const {
        std::scoped_lock lock(mutex);
        return q.size();
    }

private:
    // mutex held by caller
    std::optional<T> take() {
        if(q.empty()) return std::nullopt;
        std::optional<T> ret(std::move(q.front()));
        q.pop_front();
        cond_not_full.notify_one();
        return ret;
    }

    const std::size_t capacity;
    mutable std::mutex mutex;
    std::condition_variable cond_not_full, cond_not_empty;
    std::deque<T> q;
    bool is_closed;
};
