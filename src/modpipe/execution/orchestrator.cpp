#include "modpipe/execution/orchestrator.hpp"
#include "modpipe/common/logging.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace modpipe
{

namespace
{

std::string describe_exception(const std::exception_ptr& error)
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "Unknown exception";
    }
}

/**
 * @brief Canonical text of a descriptor; part of the plan cache key.
 */
std::string describe_for_plan(const ModuleDescriptor& d)
{
    return fmt::format("{}|{}|{}|{}|{}",
                       d.id, d.priority,
                       fmt::join(d.dependencies, ","),
                       fmt::join(d.produced_keys, ","),
                       fmt::join(d.consumed_keys, ","));
}

std::optional<Clock::time_point> earliest(std::optional<Clock::time_point> a,
                                          std::optional<Clock::time_point> b)
{
    if (!a)
    {
        return b;
    }
    if (!b)
    {
        return a;
    }
    return std::min(*a, *b);
}

enum class WaitOutcome
{
    Finished,
    ModuleTimeout,
    RunDeadline
};

} // namespace

/**
 * @brief Everything owned by one call to run_pipeline().
 */
struct Orchestrator::RunState
{
    Clock::time_point start;
    std::optional<Clock::time_point> deadline;
    WavePlanPtr plan;
    RunMetadata metadata;
    std::unordered_map<ModuleId, ModuleDescriptorPtr> descriptors;
    std::unordered_map<ModuleId, size_t> record_index;
    SharedStateStore store;
    bool halted{false};

    explicit RunState(StateMap initial_context)
        : store{std::move(initial_context)}
    {}

    bool deadline_passed() const
    {
        return deadline && Clock::now() >= *deadline;
    }

    /// Cancelled outranks PartialFailure, which outranks Complete.
    void escalate(RunStatus status)
    {
        if (status == RunStatus::Cancelled || metadata.status == RunStatus::Complete)
        {
            metadata.status = status;
        }
    }

    ModuleRecord& record(const ModuleId& id)
    {
        return metadata.modules[record_index.at(id)];
    }
};

Orchestrator::Orchestrator(std::shared_ptr<const ModuleRegistry> registry,
                           std::shared_ptr<CacheLayer> cache,
                           ExecutorPtr executor,
                           OrchestratorConfig config)
    : m_registry{std::move(registry)}
    , m_cache{std::move(cache)}
    , m_executor{std::move(executor)}
    , m_config{std::move(config)}
    , m_assembler{m_config.assembler}
{
    if (!m_registry)
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError, "Orchestrator requires a registry");
    }
    if (!m_cache)
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError, "Orchestrator requires a cache layer");
    }
    if (!m_executor)
    {
        m_executor = make_executor(ExecutorConfig{});
    }
}

WavePlanPtr Orchestrator::plan_for(const std::vector<ModuleDescriptorPtr>& descriptors)
{
    std::vector<ModuleDescriptorPtr> sorted = descriptors;
    std::sort(sorted.begin(), sorted.end(),
              [](const ModuleDescriptorPtr& a, const ModuleDescriptorPtr& b) { return a->id < b->id; });

    std::vector<std::string> args;
    args.reserve(sorted.size());
    for (const auto& d : sorted)
    {
        args.push_back(describe_for_plan(*d));
    }

    return m_cache->get_or_compute_as<WavePlan>(
        cache_fingerprint("wave_plan", args),
        [&sorted]() { return DependencyResolver::resolve(sorted); },
        kProcessLifetime);
}

PipelineRunResult Orchestrator::run_pipeline(const std::vector<ModuleId>& module_set,
                                             StateMap initial_context)
{
    RunState run{std::move(initial_context)};
    run.start = Clock::now();
    if (m_config.run_timeout.count() > 0)
    {
        run.deadline = deadline_after(run.start, m_config.run_timeout);
    }

    // Selection
    std::vector<ModuleId> requested = module_set.empty() ? m_registry->module_ids() : module_set;
    std::sort(requested.begin(), requested.end());
    requested.erase(std::unique(requested.begin(), requested.end()), requested.end());

    std::vector<ModuleDescriptorPtr> selected;
    selected.reserve(requested.size());
    for (const auto& id : requested)
    {
        if (!m_registry->contains(id))
        {
            return reject(run, fmt::format("Unknown module '{}' in module set", id));
        }
        auto descriptor = m_registry->descriptor(id);
        for (const auto& key : descriptor->produced_keys)
        {
            if (run.store.contains(key))
            {
                return reject(run, fmt::format(
                    "Initial context supplies key '{}' which module '{}' produces", key, id));
            }
        }
        run.descriptors.emplace(id, descriptor);
        selected.push_back(std::move(descriptor));
    }

    for (const auto& id : m_registry->module_ids())
    {
        if (run.descriptors.count(id) == 0)
        {
            run.metadata.unselected_modules.push_back(id);
        }
    }
    std::sort(run.metadata.unselected_modules.begin(), run.metadata.unselected_modules.end());

    // Plan
    run.plan = plan_for(selected);
    run.metadata.wave_count = run.plan->wave_count();
    for (size_t w = 0; w < run.plan->waves.size(); ++w)
    {
        for (const auto& id : run.plan->waves[w])
        {
            const auto& d = *run.descriptors.at(id);
            ModuleRecord record;
            record.id = id;
            record.name = d.display_name();
            record.priority = d.priority;
            record.required = d.required;
            record.wave_index = w;
            record.registration_index = m_registry->registration_index(id);
            record.status = ModuleStatus::Cancelled;
            record.error_kind = ModuleErrorKind::CancelledRun;
            run.record_index.emplace(id, run.metadata.modules.size());
            run.metadata.modules.push_back(std::move(record));
        }
    }

    LOG_F(INFO, "Running {} module(s) in {} wave(s)",
          run.metadata.modules.size(), run.metadata.wave_count);

    // Waves
    for (size_t w = 0; w < run.plan->waves.size(); ++w)
    {
        if (run.halted)
        {
            cancel_pending(run, w, "Not dispatched: a required module failed");
            break;
        }
        if (run.deadline_passed())
        {
            run.escalate(RunStatus::Cancelled);
            cancel_pending(run, w, "Not dispatched: run timeout expired");
            break;
        }
        run_wave(run, w);
        size_t published = run.store.commit();
        LOG_F(1, "Wave {} barrier: published {} key(s)", w, published);
    }

    run.metadata.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        Clock::now() - run.start);

    auto result = m_assembler.finalize(std::move(run.metadata), run.store.snapshot());
    if (result.status == RunStatus::Complete)
    {
        LOG_F(INFO, "{}", result.metadata.summary());
    }
    else
    {
        LOG_F(WARNING, "{}", result.metadata.summary());
    }
    return result;
}

PipelineRunResult Orchestrator::reject(RunState& run, std::string reason)
{
    LOG_F(WARNING, "Run rejected: {}", reason);
    run.metadata.status = RunStatus::Rejected;
    run.metadata.rejection_reason = std::move(reason);
    run.metadata.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        Clock::now() - run.start);
    return m_assembler.finalize(std::move(run.metadata), run.store.snapshot());
}

void Orchestrator::cancel_pending(RunState& run, size_t from_wave, const std::string& reason)
{
    for (auto& record : run.metadata.modules)
    {
        if (record.wave_index >= from_wave)
        {
            record.status = ModuleStatus::Cancelled;
            record.error_kind = ModuleErrorKind::CancelledRun;
            record.error_message = reason;
        }
    }
}

void Orchestrator::run_wave(RunState& run, size_t wave_index)
{
    const auto& wave = run.plan->waves[wave_index];
    LOG_F(1, "Wave {}: dispatching {} module(s)", wave_index, wave.size());

    auto snapshot = run.store.snapshot();

    struct Dispatched
    {
        ModuleDescriptorPtr descriptor;
        ModuleTaskPtr task;
    };
    std::vector<Dispatched> dispatched;
    dispatched.reserve(wave.size());

    auto mark_failed = [&run](const ModuleDescriptor& d, ModuleErrorKind kind, std::string message) {
        ModuleRecord& record = run.record(d.id);
        record.status = ModuleStatus::Failure;
        record.error_kind = kind;
        record.error_message = std::move(message);
        LOG_F(WARNING, "Module '{}' failed: {}", d.id, record.error_message);
        if (d.required)
        {
            run.escalate(RunStatus::PartialFailure);
            run.halted = true;
        }
    };

    auto mark_cancelled = [&run](const ModuleDescriptor& d, std::string message) {
        ModuleRecord& record = run.record(d.id);
        record.status = ModuleStatus::Cancelled;
        record.error_kind = ModuleErrorKind::CancelledRun;
        record.error_message = std::move(message);
        run.escalate(RunStatus::Cancelled);
    };

    // Dispatch, in plan order
    for (const auto& id : wave)
    {
        auto descriptor = run.descriptors.at(id);
        if (run.deadline_passed())
        {
            mark_cancelled(*descriptor, "Not dispatched: run timeout expired");
            continue;
        }

        ContentModulePtr module;
        try
        {
            module = m_registry->instance(id);
        }
        catch (const std::exception& e)
        {
            mark_failed(*descriptor, ModuleErrorKind::ModuleExecutionError,
                        fmt::format("Module instance could not be created: {}", e.what()));
            continue;
        }

        auto stop_flag = std::make_shared<std::atomic<bool>>(false);
        auto context = std::make_shared<ModuleContext>(descriptor, snapshot, m_cache, stop_flag);
        auto task = std::make_shared<ModuleTask>(std::move(module), std::move(context), stop_flag);
        try
        {
            m_executor->submit(task);
        }
        catch (const PipelineError& e)
        {
            task->cancel();
            mark_cancelled(*descriptor, e.what());
            continue;
        }
        dispatched.push_back(Dispatched{std::move(descriptor), std::move(task)});
    }

    // Barrier: wait for every dispatched module
    for (auto& item : dispatched)
    {
        const ModuleDescriptor& d = *item.descriptor;
        ModuleTask& task = *item.task;
        ModuleRecord& record = run.record(d.id);

        std::chrono::milliseconds timeout = d.timeout.count() > 0 ? d.timeout : m_config.module_timeout;

        WaitOutcome outcome = WaitOutcome::Finished;
        std::optional<Clock::time_point> module_deadline;
        if (!task.wait_until_started(run.deadline))
        {
            outcome = WaitOutcome::RunDeadline;
        }
        else if (task.state() == TaskState::Cancelled)
        {
            outcome = WaitOutcome::RunDeadline;
        }
        else
        {
            if (timeout.count() > 0)
            {
                module_deadline = deadline_after(task.start_time(), timeout);
            }
            if (!task.wait_until_finished(earliest(module_deadline, run.deadline)))
            {
                bool module_first = module_deadline &&
                                    (!run.deadline || *module_deadline <= *run.deadline);
                outcome = module_first ? WaitOutcome::ModuleTimeout : WaitOutcome::RunDeadline;
            }
        }

        if (outcome == WaitOutcome::RunDeadline)
        {
            task.cancel();
            task.request_stop();
            mark_cancelled(d, "Run timeout expired before the module finished");
            if (task.state() == TaskState::Executing || task.state() == TaskState::Finished)
            {
                record.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
                    Clock::now() - task.start_time());
            }
            LOG_F(WARNING, "Module '{}' cancelled: run timeout expired", d.id);
            continue;
        }

        // A module that finished late is still a timeout; this also covers
        // executors that run tasks inline.
        if (outcome == WaitOutcome::Finished && timeout.count() > 0 &&
            task.duration() > saturating_duration(timeout))
        {
            outcome = WaitOutcome::ModuleTimeout;
        }

        if (outcome == WaitOutcome::ModuleTimeout)
        {
            task.request_stop();
            record.status = ModuleStatus::Timeout;
            record.error_kind = ModuleErrorKind::Timeout;
            record.error_message = fmt::format("Module exceeded its timeout of {} ms", timeout.count());
            record.duration = task.state() == TaskState::Finished
                                  ? task.duration()
                                  : std::chrono::duration_cast<std::chrono::nanoseconds>(
                                        Clock::now() - task.start_time());
            LOG_F(WARNING, "Module '{}' timed out after {} ms", d.id, timeout.count());
            if (d.required)
            {
                run.escalate(RunStatus::PartialFailure);
                run.halted = true;
            }
            continue;
        }

        record.duration = task.duration();

        if (auto error = task.exception())
        {
            mark_failed(d, ModuleErrorKind::ModuleExecutionError, describe_exception(error));
            continue;
        }

        if (const auto& reason = task.skip_reason())
        {
            record.status = ModuleStatus::Skipped;
            record.error_kind = ModuleErrorKind::None;
            record.error_message = *reason;
            LOG_F(1, "Module '{}' skipped: {}", d.id, *reason);
            continue;
        }

        const ModuleOutput& output = task.output();
        if (!output.success)
        {
            mark_failed(d, ModuleErrorKind::ModuleExecutionError,
                        output.error_message.empty() ? std::string{"Module reported failure"}
                                                     : output.error_message);
            continue;
        }

        try
        {
            run.store.stage(d, output.writes);
        }
        catch (const PipelineError& e)
        {
            mark_failed(d, ModuleErrorKind::ModuleExecutionError, e.what());
            continue;
        }

        record.status = ModuleStatus::Success;
        record.error_kind = ModuleErrorKind::None;
        record.error_message.clear();
        record.content = output.content;
        LOG_F(2, "Module '{}' succeeded in {} us", d.id,
              std::chrono::duration_cast<std::chrono::microseconds>(record.duration).count());
    }
}

} // namespace modpipe
