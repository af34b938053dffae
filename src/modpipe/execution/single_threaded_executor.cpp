#include "modpipe/execution/single_threaded_executor.hpp"

namespace modpipe
{

SingleThreadedExecutor::SingleThreadedExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{}

void SingleThreadedExecutor::submit(ModuleTaskPtr task)
{
    check_accepting();
    task->run();
}

} // namespace modpipe
