/**
 * @file MessageQueue.h
 * @brief Unbounded FIFO connecting the interactive thread and the simulation thread, one per direction.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

/**
 * @class MessageQueue
 * @brief Mutex-guarded deque of move-only messages; delivery order equals push order.
 *
 * push() never blocks beyond the short critical section, so neither side ever waits for the other. waitFor()
 * lets the consumer sleep while it has nothing else to do; it is woken by the next push().
 */
template <class T>
class MessageQueue {
public:
    void push(T&& msg) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            items.push_back(std::move(msg));
        }
        cv.notify_one();
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(mtx);
        if (items.empty()) return false;
        out = std::move(items.front());
        items.pop_front();
        return true;
    }

    /** @brief Move every queued message to the back of @p out; returns how many were moved. */
    size_t drain(std::vector<T>& out) {
        std::lock_guard<std::mutex> lock(mtx);
        size_t n = items.size();
        for (auto& m : items) out.push_back(std::move(m));
        items.clear();
        return n;
    }

    /** @brief Sleep until a message is queued, @p timeout elapses, or interrupt() is called. True if non-empty. */
    template <class Rep, class Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait_for(lock, timeout, [&]{ return !items.empty() || interrupted; });
        interrupted = false;
        return !items.empty();
    }

    /** @brief Wake a consumer blocked in waitFor() without delivering a message. */
    void interrupt() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            interrupted = true;
        }
        cv.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return items.size();
    }

    bool empty() const { return size() == 0; }

private:
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::deque<T> items;
    bool interrupted{false};
};
