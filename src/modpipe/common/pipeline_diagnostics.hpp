/**
 * @file pipeline_diagnostics.hpp
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/pipeline_enums.hpp"

namespace modpipe
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Whether a diagnostic rejects the registration batch.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Logged; the batch is still accepted.
    Error     ///< Blocking issue that prevents registration.
};

/**
 * @brief What kind of registration problem was found.
 */
enum class DiagnosticCategory
{
    Cycle,                  ///< A cycle was detected among dependencies.
    UnknownDependency,      ///< A dependency id does not name a known module.
    DuplicateKeyProducer,   ///< Two modules declare the same produced key.
    DuplicateModuleId,      ///< Two modules share one id.
    UnproducedKey           ///< A consumed key has no registered producer.
};

/**
 * @brief One registration problem.
 *
 * @details
 * For `Cycle`, `involved_modules` holds exactly the ids lying on a cycle and
 * `blocked_modules` the ids that could not be scheduled only because they
 * depend (transitively) on the cycle. Both are sorted by id.
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Module ids involved in this issue.
    std::vector<ModuleId> involved_modules;

    /// Module ids that are affected downstream of the issue.
    std::vector<ModuleId> blocked_modules;

    /// Shared-state key involved in this issue (if applicable).
    StateKey key;
};

// ============================================================================
// PipelineDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected while validating module descriptors.
 *
 * @details
 * `PipelineDiagnostics` is produced by `ModuleRegistry` when a registration
 * batch is validated, and by `DependencyResolver` when a wave plan cannot be
 * computed.
 *
 * @par Error vs Warning
 * - **Errors** reject the whole registration batch. Examples: Cycle,
 *   UnknownDependency, DuplicateKeyProducer, DuplicateModuleId.
 * - **Warnings** are reported through logging only. Example: UnproducedKey,
 *   which is legitimate when the key is supplied by the initial context.
 *
 * @par Thread safety
 * Not synchronized. Items are only added while a batch is being checked;
 * afterwards the object is passed around read-only.
 */
class PipelineDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Find the first error of a category.
     * @return Pointer to the item, or nullptr if none.
     */
    const DiagnosticItem* find_error(DiagnosticCategory category) const noexcept
    {
        for (const auto& item : m_errors)
        {
            if (item.category == category)
            {
                return &item;
            }
        }
        return nullptr;
    }

    void add(DiagnosticItem item)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            m_errors.push_back(std::move(item));
        }
        else
        {
            m_warnings.push_back(std::move(item));
        }
    }

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace modpipe
