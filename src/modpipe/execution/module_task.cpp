#include "modpipe/execution/module_task.hpp"
#include "modpipe/common/logging.hpp"

namespace modpipe
{

const char* to_string(TaskState state) noexcept
{
    switch (state)
    {
    case TaskState::Queued:
        return "Queued";
    case TaskState::Executing:
        return "Executing";
    case TaskState::Finished:
        return "Finished";
    case TaskState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

ModuleTask::ModuleTask(ContentModulePtr module,
                       std::shared_ptr<const ModuleContext> context,
                       std::shared_ptr<std::atomic<bool>> stop_flag)
    : m_module{std::move(module)}
    , m_context{std::move(context)}
    , m_stop_flag{std::move(stop_flag)}
{}

void ModuleTask::run()
{
    // Transition to Executing
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        TaskState expected = TaskState::Queued;
        if (!m_state.compare_exchange_strong(expected, TaskState::Executing,
                                             std::memory_order_acq_rel))
        {
            // Cancelled before a worker got to it
            return;
        }
        m_start_time = Clock::now();
    }
    m_cv.notify_all();

    LOG_F(2, "Module '{}' started", descriptor().id);

    std::optional<std::string> skip_reason;
    ModuleOutput output;
    std::exception_ptr error;

    // Execute user code
    try
    {
        skip_reason = m_module->validate_input(*m_context);
        if (!skip_reason)
        {
            output = m_module->execute(*m_context);
        }
    }
    catch (...)
    {
        error = std::current_exception();
    }

    auto end_time = Clock::now();
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        m_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - m_start_time);
        m_exception = error;
        m_skip_reason = std::move(skip_reason);
        m_output = std::move(output);
        m_state.store(TaskState::Finished, std::memory_order_release);
    }
    m_cv.notify_all();

    LOG_F(2, "Module '{}' finished", descriptor().id);
}

bool ModuleTask::cancel()
{
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        TaskState expected = TaskState::Queued;
        if (!m_state.compare_exchange_strong(expected, TaskState::Cancelled,
                                             std::memory_order_acq_rel))
        {
            return expected == TaskState::Cancelled;
        }
    }
    m_cv.notify_all();
    return true;
}

void ModuleTask::request_stop() noexcept
{
    if (m_stop_flag)
    {
        m_stop_flag->store(true, std::memory_order_release);
    }
}

bool ModuleTask::wait_until_started(std::optional<Clock::time_point> deadline) const
{
    std::unique_lock<std::mutex> lock{m_mutex};
    auto started = [this]() { return state() != TaskState::Queued; };
    if (!deadline)
    {
        m_cv.wait(lock, started);
        return true;
    }
    return m_cv.wait_until(lock, *deadline, started);
}

bool ModuleTask::wait_until_finished(std::optional<Clock::time_point> deadline) const
{
    std::unique_lock<std::mutex> lock{m_mutex};
    auto done = [this]() {
        TaskState s = state();
        return s == TaskState::Finished || s == TaskState::Cancelled;
    };
    if (!deadline)
    {
        m_cv.wait(lock, done);
        return true;
    }
    return m_cv.wait_until(lock, *deadline, done);
}

Clock::time_point ModuleTask::start_time() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_start_time;
}

std::chrono::nanoseconds ModuleTask::duration() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_duration;
}

std::exception_ptr ModuleTask::exception() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_exception;
}

const std::optional<std::string>& ModuleTask::skip_reason() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_skip_reason;
}

const ModuleOutput& ModuleTask::output() const
{
    std::lock_guard<std::mutex> lock{m_mutex};
    return m_output;
}

} // namespace modpipe
