/**
 * @file executor.hpp
 * @brief Executors that run module tasks for the orchestrator.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/execution/module_task.hpp"

namespace modpipe
{

/**
 * @brief Settings read by make_executor().
 */
struct ExecutorConfig
{
    /**
     * @brief Size of the worker pool.
     * @details 1 selects inline execution; 0 sizes the pool from the
     *          hardware thread count.
     */
    size_t worker_count{4};
};

/**
 * @brief Interface for module task executors.
 *
 * @details
 * IExecutor accepts ModuleTasks and runs each exactly once, unless it was
 * cancelled first. One executor is shared by every wave of a run and by
 * concurrent runs; waiting for results is the caller's job (see
 * `ModuleTask::wait_until_finished()`).
 *
 * @par Thread Safety
 * All members are safe to call concurrently.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Hand a task to the executor.
     * @details Implementations may run the task before returning.
     * @throws PipelineError with `CancelledRun` if the executor is stopped.
     */
    virtual void submit(ModuleTaskPtr task) = 0;

    /**
     * @brief Check whether submit() runs tasks on the calling thread.
     */
    virtual bool runs_inline() const noexcept = 0;

    /**
     * @brief Number of tasks that may run at the same time.
     */
    virtual size_t concurrency() const noexcept = 0;

    /**
     * @brief Request graceful stop.
     *
     * @details
     * Queued tasks are cancelled and further submissions are refused. Tasks
     * already executing complete normally. This is cooperative, not preemptive.
     */
    virtual void request_stop() = 0;

    virtual bool stop_requested() const noexcept = 0;
};

using ExecutorPtr = std::shared_ptr<IExecutor>;

/**
 * @brief Shared stop flag and configuration for the concrete executors.
 */
class Executor : public IExecutor
{
public:
    explicit Executor(ExecutorConfig config);

    void request_stop() override;
    bool stop_requested() const noexcept override;

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

protected:
    /**
     * @brief Throw if the executor no longer accepts tasks.
     */
    void check_accepting() const;

    ExecutorConfig m_config;
    std::atomic<bool> m_stop_requested{false};
};

/**
 * @brief Create the executor described by config.
 * @details worker_count == 1 selects the single-threaded executor.
 */
ExecutorPtr make_executor(ExecutorConfig config);

} // namespace modpipe
