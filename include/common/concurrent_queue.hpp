#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace pysandbox {

/**
 * @brief multi-producer multi-consumer FIFO, optionally bounded
 * The batch reader pushes jobs, every worker blocks in pop().
 * @param <T> element type, moved in and out
 */
template <typename T>
struct concurrent_queue {
    /**
     * @param capacity push() blocks while this many elements are queued, 0 for no bound
     */
    explicit concurrent_queue(std::size_t capacity = 0) : capacity(capacity) {}

    /**
     * @brief take the front element, blocking while the queue is empty
     */
    T pop() {
        std::unique_lock<std::mutex> lock(mut);
        not_empty.wait(lock, [this] { return !items.empty(); });
        T front = std::move(items.front());
        items.pop_front();
        lock.unlock();
        not_full.notify_one();
        return front;
    }

    void push(T value) {
        {
            std::unique_lock<std::mutex> lock(mut);
            not_full.wait(lock, [this] { return capacity == 0 || items.size() < capacity; });
            items.push_back(std::move(value));
        }
        not_empty.notify_one();
    }

    std::size_t size() {
        std::lock_guard<std::mutex> lock(mut);
        return items.size();
    }

private:
    const std::size_t capacity;
    std::deque<T> items;
    std::mutex mut;
    std::condition_variable not_empty, not_full;
};

}  // namespace pysandbox
