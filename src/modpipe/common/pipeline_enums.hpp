/**
 * @file pipeline_enums.hpp
 */
#pragma once
#include "modpipe/common/common.hpp"

namespace modpipe
{

// ============================================================================
// Type aliases
// ============================================================================

/**
 * @brief Type alias for module identifiers.
 *
 * @details
 * Module ids are unique across a registry. They are plain strings because they
 * come from static configuration and appear verbatim in logs and metadata.
 */
using ModuleId = std::string;

/**
 * @brief Type alias for shared-state keys.
 */
using StateKey = std::string;

/**
 * @brief Clock used for all durations and deadlines.
 */
using Clock = std::chrono::steady_clock;

/**
 * @brief Convert milliseconds to `Clock::duration`, clamping to its range.
 *
 * @details
 * Configured timeouts and TTLs are milliseconds in int64, which covers far
 * more than a nanosecond `Clock::duration` can hold.
 */
inline Clock::duration saturating_duration(std::chrono::milliseconds value) noexcept
{
    constexpr auto upper = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max());
    constexpr auto lower = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::min());
    if (value >= upper)
    {
        return Clock::duration::max();
    }
    if (value <= lower)
    {
        return Clock::duration::min();
    }
    return std::chrono::duration_cast<Clock::duration>(value);
}

/**
 * @brief Deadline `span` after `start`.
 * @return nullopt when the deadline reaches the end of the clock range, which
 *         callers treat as no deadline.
 */
inline std::optional<Clock::time_point> deadline_after(Clock::time_point start,
                                                       std::chrono::milliseconds span) noexcept
{
    Clock::duration delta = saturating_duration(span);
    if (delta >= Clock::time_point::max() - start)
    {
        return std::nullopt;
    }
    return start + delta;
}

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Outcome of one module within one run.
 *
 * @details
 * - `Success`: `execute()` returned a successful output and its writes were
 *   accepted.
 * - `Failure`: `execute()` threw, reported failure, or wrote undeclared keys.
 * - `Timeout`: the module exceeded its per-module timeout; its result was
 *   discarded.
 * - `Skipped`: `validate_input()` declined to run the module.
 * - `Cancelled`: the module was never dispatched, or was still outstanding,
 *   when the run was aborted or its deadline passed.
 */
enum class ModuleStatus
{
    Success,
    Failure,
    Timeout,
    Skipped,
    Cancelled
};

/**
 * @brief Overall status of one pipeline run.
 *
 * @details
 * Callers must inspect the status before trusting the artifact.
 * - `Complete`: every required module succeeded and all waves ran.
 * - `PartialFailure`: a required module failed or timed out.
 * - `Cancelled`: the run-level timeout expired before all waves finished.
 * - `Rejected`: the run was refused before any module executed.
 */
enum class RunStatus
{
    Complete,
    PartialFailure,
    Cancelled,
    Rejected
};

/**
 * @brief Classification of a module-level error recorded in run metadata.
 */
enum class ModuleErrorKind
{
    None,
    ModuleExecutionError,
    Timeout,
    CancelledRun
};

const char* to_string(ModuleStatus status) noexcept;
const char* to_string(RunStatus status) noexcept;
const char* to_string(ModuleErrorKind kind) noexcept;

} // namespace modpipe
