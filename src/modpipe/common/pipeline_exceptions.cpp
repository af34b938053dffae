/**
 * @file pipeline_exceptions.cpp
 */
#include "modpipe/common/pipeline_exceptions.hpp"

namespace modpipe
{

const char* to_string(PipelineErrorCode code) noexcept
{
    switch (code)
    {
    case PipelineErrorCode::CyclicDependency:
        return "CyclicDependency";
    case PipelineErrorCode::UnknownDependency:
        return "UnknownDependency";
    case PipelineErrorCode::DuplicateKeyProducer:
        return "DuplicateKeyProducer";
    case PipelineErrorCode::DuplicateModuleId:
        return "DuplicateModuleId";
    case PipelineErrorCode::UnknownModule:
        return "UnknownModule";
    case PipelineErrorCode::ModuleExecutionError:
        return "ModuleExecutionError";
    case PipelineErrorCode::Timeout:
        return "Timeout";
    case PipelineErrorCode::ComputationFailed:
        return "ComputationFailed";
    case PipelineErrorCode::CancelledRun:
        return "CancelledRun";
    case PipelineErrorCode::UndeclaredStateAccess:
        return "UndeclaredStateAccess";
    case PipelineErrorCode::ConfigurationError:
        return "ConfigurationError";
    }
    return "Unknown";
}

} // namespace modpipe
