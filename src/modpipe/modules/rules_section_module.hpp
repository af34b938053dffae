/**
 * @file rules_section_module.hpp
 * @brief Content module listing the rules of one category.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/content_module.hpp"
#include "modpipe/config/pipeline_config.hpp"
#include "modpipe/rules/rule_config_store.hpp"

namespace modpipe
{

/**
 * @brief Emits a header plus one block per rule of a category.
 *
 * @details
 * Options:
 * - `category` (string, required): rule id prefix, e.g. "ESS".
 * - `title` (string): header text; defaults to "Rules <category>".
 * - `include_examples` (bool, default true): list good and bad examples.
 *
 * Rules are read through RuleConfigStore::rules_for(), so concurrent modules
 * and runs share one directory scan per category.
 *
 * Output layout:
 * @code
 * ### <title>
 * - **ESS-01 - <name>**
 *   <explanation>
 *   Question: <question>
 *   Good: <example>
 *   Bad: <example>
 * @endcode
 */
class RulesSectionModule : public IContentModule
{
public:
    RulesSectionModule(std::shared_ptr<const RuleConfigStore> store,
                       std::string category,
                       std::string title,
                       bool include_examples);

    /**
     * @brief Validate options and build the factory for the "rules" kind.
     * @throws PipelineError with `ConfigurationError` on invalid options.
     */
    static ModuleFactory build(const ModuleConfig& config, std::shared_ptr<const RuleConfigStore> store);

    ModuleOutput execute(const ModuleContext& context) const override;

    const std::string& class_name() const override;

    /**
     * @brief Format one rule as a block of lines.
     */
    static std::string format_rule(const RuleRecord& rule, bool include_examples);

private:
    std::shared_ptr<const RuleConfigStore> m_store;
    std::string m_category;
    std::string m_title;
    bool m_include_examples;
};

class ModuleCatalog;

/**
 * @brief Add the built-in "text" and "rules" kinds to a catalog.
 */
void register_builtin_kinds(ModuleCatalog& catalog, std::shared_ptr<const RuleConfigStore> store);

} // namespace modpipe
