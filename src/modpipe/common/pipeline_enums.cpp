/**
 * @file pipeline_enums.cpp
 */
#include "modpipe/common/pipeline_enums.hpp"

namespace modpipe
{

const char* to_string(ModuleStatus status) noexcept
{
    switch (status)
    {
    case ModuleStatus::Success:
        return "Success";
    case ModuleStatus::Failure:
        return "Failure";
    case ModuleStatus::Timeout:
        return "Timeout";
    case ModuleStatus::Skipped:
        return "Skipped";
    case ModuleStatus::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char* to_string(RunStatus status) noexcept
{
    switch (status)
    {
    case RunStatus::Complete:
        return "Complete";
    case RunStatus::PartialFailure:
        return "PartialFailure";
    case RunStatus::Cancelled:
        return "Cancelled";
    case RunStatus::Rejected:
        return "Rejected";
    }
    return "Unknown";
}

const char* to_string(ModuleErrorKind kind) noexcept
{
    switch (kind)
    {
    case ModuleErrorKind::None:
        return "None";
    case ModuleErrorKind::ModuleExecutionError:
        return "ModuleExecutionError";
    case ModuleErrorKind::Timeout:
        return "Timeout";
    case ModuleErrorKind::CancelledRun:
        return "CancelledRun";
    }
    return "Unknown";
}

} // namespace modpipe
