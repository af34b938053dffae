#include "modpipe/modules/rules_section_module.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include "modpipe/common/shared_state.hpp"
#include "modpipe/config/module_catalog.hpp"
#include "modpipe/modules/text_module.hpp"
#include <fmt/format.h>

namespace modpipe
{

RulesSectionModule::RulesSectionModule(std::shared_ptr<const RuleConfigStore> store,
                                       std::string category,
                                       std::string title,
                                       bool include_examples)
    : m_store{std::move(store)}
    , m_category{std::move(category)}
    , m_title{std::move(title)}
    , m_include_examples{include_examples}
{}

ModuleFactory RulesSectionModule::build(const ModuleConfig& config,
                                        std::shared_ptr<const RuleConfigStore> store)
{
    const Json::Value& options = config.options;
    auto fail = [&config](const std::string& what) {
        return PipelineError(PipelineErrorCode::ConfigurationError,
                             fmt::format("Module '{}' (rules): {}", config.id, what));
    };

    if (!store)
    {
        throw fail("no rule store configured");
    }
    if (!options.isMember("category") || !options["category"].isString() ||
        options["category"].asString().empty())
    {
        throw fail("option 'category' must be a non-empty string");
    }
    std::string category = options["category"].asString();

    std::string title = "Rules " + category;
    if (options.isMember("title"))
    {
        if (!options["title"].isString())
        {
            throw fail("option 'title' must be a string");
        }
        title = options["title"].asString();
    }

    bool include_examples = true;
    if (options.isMember("include_examples"))
    {
        if (!options["include_examples"].isBool())
        {
            throw fail("option 'include_examples' must be a boolean");
        }
        include_examples = options["include_examples"].asBool();
    }

    return [store, category, title, include_examples](const ModuleDescriptor&) -> ContentModulePtr {
        return std::make_shared<RulesSectionModule>(store, category, title, include_examples);
    };
}

ModuleOutput RulesSectionModule::execute(const ModuleContext& context) const
{
    auto rules = m_store->rules_for(m_category, context.cache());

    std::string content = "### " + m_title;
    for (const auto& rule : *rules)
    {
        content += "\n";
        content += format_rule(rule, m_include_examples);
    }
    return ModuleOutput::with_content(std::move(content));
}

const std::string& RulesSectionModule::class_name() const
{
    static const std::string name = "RulesSectionModule";
    return name;
}

std::string RulesSectionModule::format_rule(const RuleRecord& rule, bool include_examples)
{
    std::string block = rule.name.empty() ? fmt::format("- **{}**", rule.id)
                                          : fmt::format("- **{} - {}**", rule.id, rule.name);
    if (!rule.explanation.empty())
    {
        block += "\n  " + rule.explanation;
    }
    if (!rule.question.empty())
    {
        block += "\n  Question: " + rule.question;
    }
    if (include_examples)
    {
        for (const auto& example : rule.good_examples)
        {
            block += "\n  Good: " + example;
        }
        for (const auto& example : rule.bad_examples)
        {
            block += "\n  Bad: " + example;
        }
    }
    return block;
}

void register_builtin_kinds(ModuleCatalog& catalog, std::shared_ptr<const RuleConfigStore> store)
{
    catalog.add_kind("text", [](const ModuleConfig& config) { return TextModule::build(config); });
    catalog.add_kind("rules", [store](const ModuleConfig& config) {
        return RulesSectionModule::build(config, store);
    });
}

} // namespace modpipe
