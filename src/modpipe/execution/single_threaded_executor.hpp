/**
 * @file single_threaded_executor.hpp
 * @brief Inline executor that runs modules on the submitting thread.
 */
#pragma once
#include "modpipe/execution/executor.hpp"

namespace modpipe
{

/**
 * @brief Executor that runs each module task inside submit().
 *
 * @details
 * Selected when `worker_count` is 1. Waves then execute in a fixed order,
 * which gives reproducible logs and serves as the baseline the pool is
 * compared against in tests.
 *
 * Since a task has finished by the time submit() returns, nothing can be
 * interrupted: the orchestrator detects per-module timeouts after the fact
 * from the measured duration.
 *
 * @par Thread Safety
 * - submit() may be called from several threads; tasks then run on those
 *   threads.
 * - request_stop() is safe from any thread; it only refuses later submits.
 */
class SingleThreadedExecutor : public Executor
{
public:
    /**
     * @brief Create an inline executor.
     * @param config Only kept for config(); worker_count is not consulted.
     */
    explicit SingleThreadedExecutor(ExecutorConfig config = {});

    void submit(ModuleTaskPtr task) override;

    bool runs_inline() const noexcept override
    {
        return true;
    }

    size_t concurrency() const noexcept override
    {
        return 1;
    }
};

inline std::shared_ptr<SingleThreadedExecutor> make_inline_executor(ExecutorConfig config = {})
{
    return std::make_shared<SingleThreadedExecutor>(std::move(config));
}

} // namespace modpipe
