#include "modpipe/execution/executor.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include "modpipe/execution/single_threaded_executor.hpp"
#include "modpipe/execution/thread_pool_executor.hpp"

namespace modpipe
{

Executor::Executor(ExecutorConfig config)
    : m_config{std::move(config)}
{}

void Executor::request_stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

bool Executor::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire);
}

void Executor::check_accepting() const
{
    if (stop_requested())
    {
        throw PipelineError(PipelineErrorCode::CancelledRun,
                            "Task submitted to a stopped executor");
    }
}

ExecutorPtr make_executor(ExecutorConfig config)
{
    if (config.worker_count == 1)
    {
        return make_inline_executor(std::move(config));
    }
    return make_thread_pool_executor(std::move(config));
}

} // namespace modpipe
