// =================================================================
// include/Infiniloom/WorkQueue.hpp
// =================================================================
// Blocking FIFO shared by a pool of workers that also produce work.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace Infiniloom {

/**
 * @brief FIFO work queue with pool-wide completion detection
 *
 * Workers take items with pop() and report each finished item with
 * taskDone(). Items may be pushed while others are in flight, so an
 * empty queue alone does not mean the work is over: the queue declares
 * itself finished only when it is empty and no popped item is still
 * being processed. At that point, or after markDone(), every blocked
 * pop() returns false.
 */
template <typename T>
class WorkQueue {
public:
    /**
     * @brief Add an item and wake one waiting worker
     * @param item Work item
     */
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_done) {
                return;
            }
            m_items.push_back(std::move(item));
        }
        m_condition.notify_one();
    }

    /**
     * @brief Take the next item, blocking while more work may still arrive
     * @param item Receives the item
     * @return false once the queue is finished
     */
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this] { return m_done || !m_items.empty(); });

        if (m_done) {
            return false;
        }

        item = std::move(m_items.front());
        m_items.pop_front();
        m_active++;
        return true;
    }

    /**
     * @brief Report that a popped item has been fully processed
     *
     * Must be called after any push() the item caused, so that the
     * completion check sees the new work.
     */
    void taskDone() {
        bool finished = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_active > 0) {
                m_active--;
            }
            if (m_items.empty() && m_active == 0) {
                m_done = true;
                finished = true;
            }
        }
        if (finished) {
            m_condition.notify_all();
        }
    }

    /**
     * @brief Finish the queue immediately and release all waiters
     */
    void markDone() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_done = true;
            m_items.clear();
        }
        m_condition.notify_all();
    }

    bool isDone() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_done;
    }

    size_t activeCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_active;
    }

    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

private:
    std::deque<T> m_items;
    size_t m_active = 0;
    bool m_done = false;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
};

} // namespace Infiniloom
