#pragma once

/**
 * ThreadPool.hpp
 *
 * Fixed-size worker pool for transfers and device copies.
 */

#include "Logger.hpp"

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <stdexcept>

namespace wum::core {

/**
 * ThreadPool - FIFO worker pool
 *
 * Jobs are fire-and-forget; a job that throws is logged and the worker
 * moves on to the next one. The destructor drains the queue before joining.
 */
class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t numThreads = 0)
        : m_stop(false), m_activeJobs(0) {

        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4; // Fallback
        }

        m_workers.reserve(numThreads);

        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this] {
                workerLoop();
            });
        }
    }

    /**
     * Destructor - waits for all jobs to complete
     */
    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_stop = true;
        }

        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Queue a job for execution
     * @param job Function to execute on a worker thread
     */
    void post(std::function<void()> job) {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            if (m_stop) {
                throw std::runtime_error("Cannot post to stopped ThreadPool");
            }

            m_jobs.push(std::move(job));
        }

        m_condition.notify_one();
    }

    size_t size() const {
        return m_workers.size();
    }

    size_t pendingJobs() const {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        return m_jobs.size();
    }

    size_t activeJobs() const {
        return m_activeJobs.load();
    }

    /**
     * Wait until no job is queued or running
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_idleCondition.wait(lock, [this] {
            return m_jobs.empty() && m_activeJobs == 0;
        });
    }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> job;

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);

                m_condition.wait(lock, [this] {
                    return m_stop || !m_jobs.empty();
                });

                if (m_stop && m_jobs.empty()) {
                    return;
                }

                job = std::move(m_jobs.front());
                m_jobs.pop();
                ++m_activeJobs;
            }

            try {
                job();
            } catch (const std::exception& e) {
                Logger::instance().error("Worker job failed: {}", e.what());
            }

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                --m_activeJobs;
                if (m_jobs.empty() && m_activeJobs == 0) {
                    m_idleCondition.notify_all();
                }
            }
        }
    }

private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_jobs;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;

    bool m_stop;
    std::atomic<size_t> m_activeJobs;
};

} // namespace wum::core
