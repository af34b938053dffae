/**
 * @file module_catalog.hpp
 * @brief Maps configured module kinds to factories.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/module_registry.hpp"
#include "modpipe/config/pipeline_config.hpp"

namespace modpipe
{

/**
 * @brief Builds the factory of one configured module.
 *
 * @details Called once per configured module at registration time. It should
 *          validate the module's options and throw `ConfigurationError` if they
 *          are invalid; the returned factory creates the instance lazily.
 */
using ModuleBuilder = std::function<ModuleFactory(const ModuleConfig&)>;

/**
 * @brief Registry of module kinds usable from configuration.
 *
 * @par Thread safety
 * - Not synchronized; populate before use, then share read-only.
 */
class ModuleCatalog
{
public:
    /**
     * @brief Add a module kind.
     * @throws PipelineError with `ConfigurationError` if the kind exists or
     *         the builder is empty.
     */
    void add_kind(const std::string& kind, ModuleBuilder builder);

    bool has_kind(const std::string& kind) const;

    /**
     * @brief Get all kinds, sorted.
     */
    std::vector<std::string> kinds() const;

    /**
     * @brief Build the registration of one configured module.
     * @throws PipelineError with `ConfigurationError` if the kind is unknown
     *         or its options are invalid.
     */
    ModuleRegistration make_registration(const ModuleConfig& module) const;

    /**
     * @brief Register every configured module as one batch.
     * @throws PipelineError with `ConfigurationError` for unknown kinds or
     *         invalid options; RegistrationError if the batch is rejected.
     */
    void register_all(const PipelineConfig& config, ModuleRegistry& registry) const;

private:
    std::map<std::string, ModuleBuilder> m_builders;
};

} // namespace modpipe
