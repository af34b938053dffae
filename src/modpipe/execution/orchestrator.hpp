/**
 * @file orchestrator.hpp
 * @brief Orchestrator runs module sets wave by wave over an executor.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/cache_layer.hpp"
#include "modpipe/common/dependency_resolver.hpp"
#include "modpipe/common/module_registry.hpp"
#include "modpipe/execution/content_assembler.hpp"
#include "modpipe/execution/executor.hpp"
#include "modpipe/execution/run_result.hpp"

namespace modpipe
{

/**
 * @brief Configuration for Orchestrator.
 */
struct OrchestratorConfig
{
    /**
     * @brief Deadline for a whole run, measured from the call to run_pipeline().
     * @details Zero means no run-level timeout.
     */
    std::chrono::milliseconds run_timeout{0};

    /**
     * @brief Per-module timeout used when a descriptor does not set one.
     * @details Zero means no per-module timeout.
     */
    std::chrono::milliseconds module_timeout{0};

    AssemblerConfig assembler{};
};

/**
 * @brief Executes registered modules in dependency waves.
 *
 * @details
 * `run_pipeline()` resolves the requested module set into waves (reusing a
 * cached plan for a set it has seen before), then for each wave:
 * 1. Builds one context per module from the shared-state snapshot.
 * 2. Submits every module of the wave to the executor in dispatch order.
 * 3. Waits for all of them (wave barrier), enforcing per-module and run
 *    timeouts.
 * 4. Publishes the writes of successful modules to shared state.
 *
 * @par Failure policy
 * - An optional module that fails or times out is excluded from the artifact;
 *   its siblings and later waves are unaffected.
 * - A required module that fails or times out lets its wave finish, then
 *   stops the run: later waves are not dispatched and their modules are
 *   recorded `Cancelled`. The run status is `PartialFailure`.
 * - When the run timeout expires, no further module is dispatched, modules
 *   still outstanding are recorded `Cancelled` and the run status is
 *   `Cancelled`.
 * - Per-module timeouts count from the moment the module starts executing.
 *   A timed-out module is recorded `Timeout`, its result is discarded and its
 *   stop flag is raised. It is not killed.
 *
 * Errors inside modules never escape `run_pipeline()`; they are recorded in
 * the run metadata.
 *
 * @par Thread safety
 * - run_pipeline() may be called concurrently; runs share only the registry,
 *   cache and executor, which are thread-safe.
 */
class Orchestrator
{
public:
    /**
     * @param registry Registered modules.
     * @param cache Process-wide cache; also stores wave plans.
     * @param executor Executor shared by all runs; null selects a thread pool
     *        with the default ExecutorConfig.
     * @param config Timeouts and assembly options.
     * @throws PipelineError with `ConfigurationError` if registry or cache is null.
     */
    Orchestrator(std::shared_ptr<const ModuleRegistry> registry,
                 std::shared_ptr<CacheLayer> cache,
                 ExecutorPtr executor = nullptr,
                 OrchestratorConfig config = {});

    /**
     * @brief Run a set of modules and assemble their output.
     *
     * @param module_set Ids to run; empty means every registered module.
     * @param initial_context Shared-state entries available from wave 0.
     * @return The run result. Its status is `Rejected` if module_set names an
     *         unregistered module, or if initial_context supplies a key that a
     *         selected module produces; nothing is executed in that case.
     */
    PipelineRunResult run_pipeline(const std::vector<ModuleId>& module_set = {},
                                   StateMap initial_context = {});

    /**
     * @brief Get the wave plan for a set of descriptors.
     * @details Plans are cached in the cache layer for the process lifetime.
     */
    WavePlanPtr plan_for(const std::vector<ModuleDescriptorPtr>& descriptors);

    const OrchestratorConfig& config() const noexcept
    {
        return m_config;
    }

    const ExecutorPtr& executor() const noexcept
    {
        return m_executor;
    }

private:
    struct RunState;

    PipelineRunResult reject(RunState& run, std::string reason);
    void run_wave(RunState& run, size_t wave_index);
    void cancel_pending(RunState& run, size_t from_wave, const std::string& reason);

    std::shared_ptr<const ModuleRegistry> m_registry;
    std::shared_ptr<CacheLayer> m_cache;
    ExecutorPtr m_executor;
    OrchestratorConfig m_config;
    ContentAssembler m_assembler;
};

} // namespace modpipe
