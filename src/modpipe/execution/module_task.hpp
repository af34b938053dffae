/**
 * @file module_task.hpp
 * @brief ModuleTask wraps one module execution for dispatch to an executor.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/content_module.hpp"
#include "modpipe/common/shared_state.hpp"
#include <condition_variable>

namespace modpipe
{

class ModuleTask;

using ModuleTaskPtr = std::shared_ptr<ModuleTask>;

/**
 * @brief Execution state of a ModuleTask.
 */
enum class TaskState
{
    Queued,     ///< Created and handed to an executor, not yet started.
    Executing,  ///< A worker is running the module.
    Finished,   ///< The module returned, threw, or declined to run.
    Cancelled   ///< Cancelled before a worker picked it up.
};

const char* to_string(TaskState state) noexcept;

/**
 * @brief Unit of work sent to executors: one module, one run.
 *
 * @details
 * ModuleTask handles:
 * - Pre-execution: state transition, start time.
 * - User code: `validate_input()`, then `execute()` unless input was declined.
 * - Post-execution: duration, exception capture, waking waiters.
 *
 * The orchestrator waits on a task with deadlines (`wait_until_started()`,
 * `wait_until_finished()`). When it stops waiting because of a timeout, the
 * task is abandoned: it keeps running on its worker, its stop flag is raised
 * through `request_stop()`, and its result is ignored.
 *
 * @par Ownership Model
 * - The orchestrator and the executor queue share ownership via shared_ptr,
 *   so an abandoned task outlives the run that created it.
 * - The task owns its context, which keeps the wave's snapshot alive.
 *
 * @par Thread Safety
 * - State uses an atomic plus a mutex/condition variable pair for waiting.
 * - Results are written once, before the transition to Finished, and may
 *   be read by any thread after observing Finished.
 */
class ModuleTask
{
public:
    ModuleTask(ContentModulePtr module,
               std::shared_ptr<const ModuleContext> context,
               std::shared_ptr<std::atomic<bool>> stop_flag);

    // Non-copyable, non-movable
    ModuleTask(const ModuleTask&) = delete;
    ModuleTask(ModuleTask&&) = delete;
    ModuleTask& operator=(const ModuleTask&) = delete;
    ModuleTask& operator=(ModuleTask&&) = delete;

    /**
     * @brief Execute this task (called by a worker).
     *
     * @details
     * 1. Transition Queued -> Executing; return if the task was cancelled.
     * 2. Record start time.
     * 3. Call `validate_input()`, then `execute()` unless a skip reason was
     *    returned.
     * 4. Catch exceptions, record duration, transition to Finished.
     */
    void run();

    /**
     * @brief Cancel the task if no worker has started it.
     * @return True if the task is now Cancelled.
     */
    bool cancel();

    /**
     * @brief Raise the cooperative stop flag seen by the module.
     */
    void request_stop() noexcept;

    TaskState state() const noexcept
    {
        return m_state.load(std::memory_order_acquire);
    }

    /**
     * @brief Block until the task leaves Queued or the deadline passes.
     * @param deadline nullopt waits without limit.
     * @return True if the task has left Queued.
     */
    bool wait_until_started(std::optional<Clock::time_point> deadline) const;

    /**
     * @brief Block until the task is Finished or Cancelled, or the deadline passes.
     * @param deadline nullopt waits without limit.
     * @return True if the task is Finished or Cancelled.
     */
    bool wait_until_finished(std::optional<Clock::time_point> deadline) const;

    /**
     * @brief Get the time the worker started the task.
     * @pre state() is Executing or Finished.
     */
    Clock::time_point start_time() const;

    /**
     * @brief Get the duration of `validate_input()` plus `execute()`.
     * @return The duration, or zero if not finished.
     */
    std::chrono::nanoseconds duration() const;

    /**
     * @brief Get the captured exception, or nullptr.
     * @pre state() == Finished
     */
    std::exception_ptr exception() const;

    /**
     * @brief Get the reason `validate_input()` declined to run, if any.
     * @pre state() == Finished
     */
    const std::optional<std::string>& skip_reason() const;

    /**
     * @brief Get the module output.
     * @pre state() == Finished and exception() == nullptr
     */
    const ModuleOutput& output() const;

    const ModuleDescriptor& descriptor() const noexcept
    {
        return m_context->descriptor();
    }

private:
    // Configuration (immutable after construction)
    ContentModulePtr m_module;
    std::shared_ptr<const ModuleContext> m_context;
    std::shared_ptr<std::atomic<bool>> m_stop_flag;

    // Execution state
    std::atomic<TaskState> m_state{TaskState::Queued};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;

    // Results (written once, guarded by m_mutex)
    Clock::time_point m_start_time{};
    std::chrono::nanoseconds m_duration{0};
    std::exception_ptr m_exception{};
    std::optional<std::string> m_skip_reason{};
    ModuleOutput m_output{};
};

} // namespace modpipe
