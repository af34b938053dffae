/**
 * @file text_module.hpp
 * @brief Content module emitting a templated text fragment.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/content_module.hpp"
#include "modpipe/config/pipeline_config.hpp"

namespace modpipe
{

/**
 * @brief Emits a fixed template with `{key}` placeholders filled from shared state.
 *
 * @details
 * Options:
 * - `text` (string, required): the template. A placeholder is substituted
 *   only when `key` is one of the module's consumed keys; a consumed key with
 *   no string value becomes empty text. Other braces are left untouched.
 * - `requires` (array of strings): consumed keys that must have a value; the
 *   module is skipped otherwise.
 * - `writes` (object of strings): shared-state entries to publish; every key
 *   must be a produced key. Values are rendered as templates too.
 */
class TextModule : public IContentModule
{
public:
    TextModule(std::string text_template,
               std::vector<StateKey> required_keys,
               std::map<StateKey, std::string> writes);

    /**
     * @brief Validate options and build the factory for the "text" kind.
     * @throws PipelineError with `ConfigurationError` on invalid options.
     */
    static ModuleFactory build(const ModuleConfig& config);

    std::optional<std::string> validate_input(const ModuleContext& context) const override;

    ModuleOutput execute(const ModuleContext& context) const override;

    const std::string& class_name() const override;

    /**
     * @brief Substitute `{key}` placeholders.
     */
    static std::string render(const std::string& text_template, const ModuleContext& context);

private:
    std::string m_template;
    std::vector<StateKey> m_required_keys;
    std::map<StateKey, std::string> m_writes;
};

} // namespace modpipe
