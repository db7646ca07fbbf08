/**
 * @file CWorkerPool.cpp
 * @brief Implementation of the worker thread pool
 * @version 1.0
 * @date 2025-12-01
 */

#include "CWorkerPool.hpp"

namespace lap {
namespace rds {

using namespace core;

CWorkerPool::CWorkerPool(UInt32 threadCount) noexcept {
    if (threadCount == 0) {
        LAP_RDS_LOG_WARN << "Worker count is 0, setting to 1";
        threadCount = 1;
    }

    m_workers.reserve(threadCount);
    for (UInt32 i = 0; i < threadCount; ++i) {
        m_workers.emplace_back([this] { workerLoop(); });
    }

    LAP_RDS_LOG_DEBUG << "Worker pool started with " << threadCount << " threads";
}

CWorkerPool::~CWorkerPool() {
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

void CWorkerPool::workerLoop() noexcept {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });

            // drain before exiting
            if (m_stop && m_tasks.empty()) {
                return;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        // packaged_task stores exceptions in its future
        task();
    }
}

Bool CWorkerPool::enqueue(std::function<void()> task) noexcept {
    {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        if (m_stop) {
            LAP_RDS_LOG_WARN << "Worker pool stopping, running task inline";
            return false;
        }
        m_tasks.push(std::move(task));
    }
    m_condition.notify_one();
    return true;
}

Size CWorkerPool::pendingTasks() const noexcept {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    return m_tasks.size();
}

} // namespace rds
} // namespace lap
