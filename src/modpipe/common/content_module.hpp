/**
 * @file content_module.hpp
 * @brief Interface for content modules and their output.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/module_descriptor.hpp"
#include "modpipe/common/shared_value.hpp"

namespace modpipe
{

class ModuleContext;

/**
 * @brief Map of shared-state entries, ordered by key.
 */
using StateMap = std::map<StateKey, SharedValue>;

/**
 * @brief Result of one call to IContentModule::execute().
 *
 * @details
 * - `content` is this module's fragment of the artifact.
 * - `writes` are the shared-state entries this module publishes. They become
 *   visible to later waves once the current wave has finished. Every key must
 *   be one of the module's declared produced keys, otherwise the whole write
 *   set is rejected and the module is recorded as failed.
 * - `success == false` marks a reported (non-exceptional) failure.
 */
struct ModuleOutput
{
    std::string content;
    StateMap writes;
    bool success{true};
    std::string error_message;

    static ModuleOutput with_content(std::string content)
    {
        ModuleOutput output;
        output.content = std::move(content);
        return output;
    }

    static ModuleOutput failure(std::string error_message)
    {
        ModuleOutput output;
        output.success = false;
        output.error_message = std::move(error_message);
        return output;
    }
};

/**
 * @brief Interface for content modules.
 *
 * @details
 * A content module produces one fragment of the final artifact. One instance
 * is created per registered descriptor and reused by every run, sequential and
 * concurrent, so implementations must not keep per-run state: everything a run
 * needs is read from the `ModuleContext`, and everything it produces is
 * returned in the `ModuleOutput`. Both methods are `const` for that reason.
 *
 * @par Thread Safety
 * - `execute()` and `validate_input()` may be called concurrently from any
 *   worker thread.
 * - Implementations may call the cache layer or an external service and may
 *   block while doing so.
 * - Long-running implementations should poll `ModuleContext::stop_requested()`
 *   and return early once it is set; nothing interrupts them otherwise.
 *
 * @par Lifecycle
 * - Created lazily by the factory passed to `ModuleRegistry::register_module()`.
 * - Lifetime managed via shared_ptr; owned by the registry.
 */
class IContentModule
{
public:
    virtual ~IContentModule() = 0;

    /**
     * @brief Decide whether the module should run with the given context.
     * @return A reason to skip the module, or nullopt to run it.
     */
    virtual std::optional<std::string> validate_input(const ModuleContext& context) const
    {
        (void)context;
        return std::nullopt;
    }

    /**
     * @brief Produce this module's fragment.
     *
     * @throws Any exception to indicate failure. The exception is caught by the
     *         executor and the module is recorded as `Failure`.
     */
    virtual ModuleOutput execute(const ModuleContext& context) const = 0;

    /**
     * @brief Get the class name for logging.
     */
    virtual const std::string& class_name() const = 0;

protected:
    IContentModule() = default;

private:
    IContentModule(const IContentModule&) = delete;
    IContentModule(IContentModule&&) = delete;
    IContentModule& operator=(const IContentModule&) = delete;
    IContentModule& operator=(IContentModule&&) = delete;
};

inline IContentModule::~IContentModule() = default;

using ContentModulePtr = std::shared_ptr<const IContentModule>;

/**
 * @brief Factory creating the singleton instance for a descriptor.
 */
using ModuleFactory = std::function<ContentModulePtr(const ModuleDescriptor&)>;

} // namespace modpipe
