#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace cadence::engine {

    /**
     * @brief Blocking multi-consumer queue. pop() returns false once the queue
     * is stopped and drained.
     */
    template <typename Job>
    class JobQueue {
    public:
        void push(Job job) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push(std::move(job));
            }
            m_cv.notify_one();
        }

        bool pop(Job& job) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });

            if (m_stop && m_queue.empty()) return false;

            job = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_cv.notify_all();
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

    private:
        std::queue<Job> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::atomic<bool> m_stop{false};
    };

}
