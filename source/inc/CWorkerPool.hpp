/**
 * @file CWorkerPool.hpp
 * @brief Fixed size worker thread pool with a FIFO task queue
 * @version 1.0
 * @date 2025-12-01
 *
 * Destruction stops accepting work, lets the workers drain the queue and
 * joins them.
 */
#ifndef LAP_RDS_WORKERPOOL_HPP
#define LAP_RDS_WORKERPOOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include "CDataType.hpp"

namespace lap {
namespace rds {

class CWorkerPool {
public:
    explicit CWorkerPool(core::UInt32 threadCount = LAP_RDS_DEFAULT_ASYNC_WORKERS) noexcept;
    ~CWorkerPool();

    CWorkerPool(const CWorkerPool&) = delete;
    CWorkerPool& operator=(const CWorkerPool&) = delete;

    /**
     * @brief Queue a callable and get a future for its result
     *
     * After shutdown started the callable runs on the calling thread.
     */
    template <class F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;

        auto packaged = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(task));
        std::future<ReturnType> future = packaged->get_future();

        if (!enqueue([packaged]() { (*packaged)(); })) {
            (*packaged)();
        }
        return future;
    }

    core::UInt32 threadCount() const noexcept        { return static_cast<core::UInt32>(m_workers.size()); }
    core::Size pendingTasks() const noexcept;

private:
    /// @return false if the pool is stopping and the task was not queued
    core::Bool enqueue(std::function<void()> task) noexcept;
    void workerLoop() noexcept;

    std::vector<std::thread>                m_workers;
    std::queue<std::function<void()>>       m_tasks;
    mutable std::mutex                      m_queueMutex;
    std::condition_variable                 m_condition;
    core::Bool                              m_stop{false};
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_WORKERPOOL_HPP
