/** @file Channel.hpp
 *
 * @brief Bounded multi-producer queue that never blocks its producers.
 */

#pragma once

#include <deque>
#include <mutex>
#include <vector>
#include <cstddef>

template <class T>
class Channel {
private:
    std::mutex mtx;
    std::deque<T> queue;
    size_t capacity;
    size_t n_dropped = 0;

public:
    explicit Channel(size_t capacity) : capacity(capacity) {}

    /**
     * Queue a value.
     *
     * @return False if the channel was full, the value is then dropped.
     */
    bool trySend(T value) {
        std::lock_guard<std::mutex> lock(mtx);
        if (queue.size() >= capacity) {
            n_dropped++;
            return false;
        }
        queue.push_back(std::move(value));
        return true;
    }

    /** Take everything that is queued, in sending order. */
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<T> out;
        out.reserve(queue.size());
        for (auto &v : queue)
            out.push_back(std::move(v));
        queue.clear();
        return out;
    }

    /** Number of values dropped since the last call, resets the count. */
    size_t takeDropped() {
        std::lock_guard<std::mutex> lock(mtx);
        size_t n = n_dropped;
        n_dropped = 0;
        return n;
    }
};
