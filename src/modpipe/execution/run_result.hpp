/**
 * @file run_result.hpp
 * @brief Definition of PipelineRunResult returned by Orchestrator::run_pipeline().
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/pipeline_enums.hpp"
#include "modpipe/common/shared_state.hpp"

namespace modpipe
{

/**
 * @brief Outcome of one module within one run.
 */
struct ModuleRecord
{
    ModuleId id;
    std::string name;
    int priority{0};
    bool required{false};

    /// Index of the wave the module was planned in.
    size_t wave_index{0};

    /// Position of the module in registry order; assembly tie-breaker.
    size_t registration_index{0};

    ModuleStatus status{ModuleStatus::Cancelled};
    ModuleErrorKind error_kind{ModuleErrorKind::None};
    std::string error_message;

    /// Duration of `execute()`; zero if the module never started.
    std::chrono::nanoseconds duration{0};

    /// Content produced by the module; only kept for `Success`.
    std::string content;
};

/**
 * @brief Metadata describing one pipeline run.
 *
 * @details
 * - `modules` lists every selected module in plan order (wave by wave,
 *   dispatch order inside a wave).
 * - `unselected_modules` lists registered modules that were not part of the
 *   requested module set, sorted by id.
 */
struct RunMetadata
{
    RunStatus status{RunStatus::Complete};
    std::vector<ModuleRecord> modules;
    std::vector<ModuleId> unselected_modules;
    size_t wave_count{0};
    std::chrono::nanoseconds total_duration{0};
    size_t artifact_length{0};

    /// Reason for a `Rejected` run; empty otherwise.
    std::string rejection_reason;

    /**
     * @brief Find the record of a module.
     * @return Pointer to the record, or nullptr if the module was not selected.
     */
    const ModuleRecord* find(const ModuleId& id) const noexcept
    {
        for (const auto& record : modules)
        {
            if (record.id == id)
            {
                return &record;
            }
        }
        return nullptr;
    }

    size_t count(ModuleStatus status) const noexcept
    {
        return static_cast<size_t>(std::count_if(
            modules.begin(), modules.end(),
            [status](const ModuleRecord& r) { return r.status == status; }));
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "Run ";
        result += to_string(status);
        result += " (waves=" + std::to_string(wave_count);
        result += ", succeeded=" + std::to_string(count(ModuleStatus::Success));
        result += ", failed=" + std::to_string(count(ModuleStatus::Failure));
        result += ", timed_out=" + std::to_string(count(ModuleStatus::Timeout));
        result += ", skipped=" + std::to_string(count(ModuleStatus::Skipped));
        result += ", cancelled=" + std::to_string(count(ModuleStatus::Cancelled));
        result += ", artifact_length=" + std::to_string(artifact_length) + ")";
        return result;
    }
};

/**
 * @brief Result of Orchestrator::run_pipeline().
 *
 * @details
 * Callers must check `status` before trusting `artifact`: a run that is not
 * `Complete` still returns whatever content its successful modules produced.
 */
struct PipelineRunResult
{
    RunStatus status{RunStatus::Complete};
    std::string artifact;
    RunMetadata metadata;

    /// Final shared state of the run, initial context included.
    StateSnapshot shared_state;
};

} // namespace modpipe
