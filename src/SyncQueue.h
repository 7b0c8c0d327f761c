/**
 * @file SyncQueue.h
 * @brief Thread-safe FIFO used for the request queue and the signal channel
 *
 * Any number of producers, one consumer. push() wakes a consumer blocked
 * in waitPop(); tryPop() never blocks.
 */

#ifndef ASSETSYNC_SYNC_QUEUE_H
#define ASSETSYNC_SYNC_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

template <typename T>
class SyncQueue {
public:
    SyncQueue() = default;

    // Non-copyable
    SyncQueue(const SyncQueue&) = delete;
    SyncQueue& operator=(const SyncQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_items.push_back(std::move(item));
        }
        m_cv.notify_one();
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_items.empty()) return false;
        out = std::move(m_items.front());
        m_items.pop_front();
        return true;
    }

    // Blocks until an item arrives, wake() is called, or the timeout expires.
    // Returns false if nothing was popped.
    bool waitPop(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        uint64_t wakeSeq = m_wakeSeq;
        m_cv.wait_for(lock, timeout, [&] {
            return !m_items.empty() || m_wakeSeq != wakeSeq;
        });
        if (m_items.empty()) return false;
        out = std::move(m_items.front());
        m_items.pop_front();
        return true;
    }

    // Release a consumer blocked in waitPop() without enqueuing anything
    void wake() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_wakeSeq++;
        }
        m_cv.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.empty();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_items.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_items;
    uint64_t m_wakeSeq = 0;
};

#endif // ASSETSYNC_SYNC_QUEUE_H
