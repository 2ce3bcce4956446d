#pragma once

/**
 * ThreadPool.hpp
 *
 * Worker threads that host transfer executors. An executor occupies its
 * worker for the whole transfer, so the pool is sized to the scheduler's
 * concurrency ceiling and grows with it. An executor may keep its worker
 * after its transfer has finished; a job submitted while every worker is
 * busy gets a new worker instead of waiting.
 */

#include "Logger.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace courier::core {

class ThreadPool {
public:
    using Job = std::function<void()>;

    /**
     * @param workers Initial worker count (at least one is started)
     */
    explicit ThreadPool(size_t workers) {
        ensureWorkers(workers == 0 ? 1 : workers);
    }

    /**
     * Runs every job still queued, then joins the workers
     */
    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_wake.notify_all();

        for (auto& worker : m_workers) {
            worker.join();
        }
        COURIER_LOG_TRACE("ThreadPool joined {} workers", m_workers.size());
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a job; jobs start in submission order
     * @throws std::runtime_error once the pool is shutting down
     */
    void submit(Job job) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                throw std::runtime_error("ThreadPool is shutting down");
            }
            m_jobs.push_back(std::move(job));
            if (m_busy + m_jobs.size() > m_workers.size()) {
                m_workers.emplace_back(&ThreadPool::run, this);
                COURIER_LOG_DEBUG("ThreadPool grew to {} workers", m_workers.size());
            }
        }
        m_wake.notify_one();
    }

    size_t workerCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_workers.size();
    }

    // Grow to at least count workers; never shrinks
    void ensureWorkers(size_t count) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            throw std::runtime_error("ThreadPool is shutting down");
        }
        while (m_workers.size() < count) {
            m_workers.emplace_back(&ThreadPool::run, this);
        }
    }

private:
    void run() {
        for (;;) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_wake.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
                if (m_jobs.empty()) {
                    return;
                }
                job = std::move(m_jobs.front());
                m_jobs.pop_front();
                ++m_busy;
            }

            try {
                job();
            } catch (const std::exception& e) {
                COURIER_LOG_ERROR("Worker job threw: {}", e.what());
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            --m_busy;
        }
    }

    std::vector<std::thread> m_workers;
    std::deque<Job> m_jobs;

    std::mutex m_mutex;
    std::condition_variable m_wake;
    size_t m_busy{0};
    bool m_stopping{false};
};

} // namespace courier::core
