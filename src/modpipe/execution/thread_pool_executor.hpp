/**
 * @file thread_pool_executor.hpp
 * @brief ThreadPoolExecutor, a bounded pool of worker threads.
 */
#pragma once
#include "modpipe/execution/executor.hpp"
#include <condition_variable>
#include <deque>
#include <thread>

namespace modpipe
{

/**
 * @brief Executor running tasks on a fixed number of worker threads.
 *
 * @details
 * Tasks are started in submission (FIFO) order. The pool is created once and
 * shared by all waves and all runs; nothing is spawned per wave.
 *
 * A task abandoned by the orchestrator after a timeout keeps occupying its
 * worker until the module returns. Modules that can block for long should
 * poll `ModuleContext::stop_requested()`.
 *
 * @par Lifecycle
 * - request_stop() cancels queued tasks and refuses new ones.
 * - The destructor stops the pool and joins every worker, waiting for tasks
 *   that are still executing.
 *
 * @par Thread Safety
 * - All public methods may be called from any thread.
 */
class ThreadPoolExecutor : public Executor
{
public:
    explicit ThreadPoolExecutor(ExecutorConfig config = {});
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void submit(ModuleTaskPtr task) override;

    void request_stop() override;

    bool runs_inline() const noexcept override
    {
        return false;
    }

    size_t concurrency() const noexcept override
    {
        return m_workers.size();
    }

    /**
     * @brief Number of tasks waiting for a worker.
     */
    size_t queued_count() const;

private:
    void worker_loop();

    std::vector<std::thread> m_workers;
    std::deque<ModuleTaskPtr> m_queue;
    mutable std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    bool m_shutdown{false};
};

/**
 * @brief Factory function to create a ThreadPoolExecutor.
 */
inline std::shared_ptr<ThreadPoolExecutor> make_thread_pool_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<ThreadPoolExecutor>(std::move(config));
}

} // namespace modpipe
