#include "modpipe/execution/thread_pool_executor.hpp"
#include "modpipe/common/logging.hpp"

namespace modpipe
{

ThreadPoolExecutor::ThreadPoolExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{
    size_t count = m_config.worker_count;
    if (count == 0)
    {
        count = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    m_workers.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        m_workers.emplace_back([this]() { worker_loop(); });
    }
    LOG_F(1, "Thread pool started with {} worker(s)", count);
}

ThreadPoolExecutor::~ThreadPoolExecutor()
{
    request_stop();
    {
        std::lock_guard<std::mutex> lock{m_queue_mutex};
        m_shutdown = true;
    }
    m_queue_cv.notify_all();
    for (auto& worker : m_workers)
    {
        worker.join();
    }
}

void ThreadPoolExecutor::submit(ModuleTaskPtr task)
{
    {
        std::lock_guard<std::mutex> lock{m_queue_mutex};
        check_accepting();
        m_queue.push_back(std::move(task));
    }
    m_queue_cv.notify_one();
}

void ThreadPoolExecutor::request_stop()
{
    std::deque<ModuleTaskPtr> dropped;
    {
        std::lock_guard<std::mutex> lock{m_queue_mutex};
        Executor::request_stop();
        dropped.swap(m_queue);
    }
    for (auto& task : dropped)
    {
        task->cancel();
    }
}

size_t ThreadPoolExecutor::queued_count() const
{
    std::lock_guard<std::mutex> lock{m_queue_mutex};
    return m_queue.size();
}

void ThreadPoolExecutor::worker_loop()
{
    while (true)
    {
        ModuleTaskPtr task;
        {
            std::unique_lock<std::mutex> lock{m_queue_mutex};
            m_queue_cv.wait(lock, [this]() { return m_shutdown || !m_queue.empty(); });
            if (m_queue.empty())
            {
                return;
            }
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }
        // run() never throws; module exceptions are captured in the task.
        task->run();
    }
}

} // namespace modpipe
