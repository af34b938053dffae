/**
 * @file pipeline_exceptions.hpp
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/pipeline_diagnostics.hpp"

namespace modpipe
{

/**
 * @brief Error codes for pipeline operations.
 *
 * @details
 * Registration-time codes (`CyclicDependency`, `UnknownDependency`,
 * `DuplicateKeyProducer`, `DuplicateModuleId`) are fatal for the batch being
 * registered. Run-time codes (`ModuleExecutionError`, `Timeout`,
 * `CancelledRun`) are recorded per module and never escape `run_pipeline()`.
 * `ComputationFailed` is thrown by the cache to the triggering caller and to
 * every caller that waited on the same computation.
 */
enum class PipelineErrorCode
{
    CyclicDependency,
    UnknownDependency,
    DuplicateKeyProducer,
    DuplicateModuleId,
    UnknownModule,
    ModuleExecutionError,
    Timeout,
    ComputationFailed,
    CancelledRun,
    UndeclaredStateAccess,
    ConfigurationError
};

/**
 * @brief Exception class for pipeline errors.
 *
 * @details
 * `PipelineError` is thrown by registry, resolver, cache, configuration and
 * module-context operations. Each exception carries an error code and a
 * descriptive message.
 *
 * @par Thread safety
 * Immutable after construction. The cache stores one instance in an
 * exception_ptr and rethrows it to every caller waiting on the same key.
 */
class PipelineError : public std::exception
{
public:
    PipelineError(PipelineErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    PipelineErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    PipelineErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when a registration batch fails validation.
 *
 * @details
 * The code is taken from the first error item; the full list of problems is
 * available through `diagnostics()`.
 */
class RegistrationError : public PipelineError
{
public:
    RegistrationError(PipelineErrorCode code,
                      std::string message,
                      std::shared_ptr<const PipelineDiagnostics> diagnostics)
        : PipelineError(code, std::move(message))
        , m_diagnostics(std::move(diagnostics))
    {
    }

    /**
     * @brief Every error and warning found in the rejected batch.
     */
    const std::shared_ptr<const PipelineDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<const PipelineDiagnostics> m_diagnostics;
};

const char* to_string(PipelineErrorCode code) noexcept;

} // namespace modpipe
