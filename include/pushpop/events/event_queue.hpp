/**
 * @file event_queue.hpp
 * @brief Blocking FIFO that carries I/O completions to the engine thread
 *
 * Worker threads (socket reads, disk writes, timers) push exactly one
 * event each; a single consumer pops and applies them in order.
 *
 * EXAMPLE:
 * ThreadSafeQueue<EngineEvent> queue;
 * queue.push(ChunkRead{...});     // io thread
 * auto event = queue.pop();       // engine thread, blocks
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace pushpop::events {

/**
 * @brief Thread-safe FIFO queue
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - close() wakes every waiter; pop() then drains what is left and
 *   returns nullopt once empty
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Append an item; dropped silently after close()
     *
     * RETURNS: false if the queue was closed
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Block until an item arrives or the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !items_.empty() || closed_; });
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace pushpop::events
