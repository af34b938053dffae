#include "modpipe/config/module_catalog.hpp"
#include "modpipe/common/logging.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace modpipe
{

void ModuleCatalog::add_kind(const std::string& kind, ModuleBuilder builder)
{
    if (!builder)
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Module kind '{}' has no builder", kind));
    }
    if (!m_builders.emplace(kind, std::move(builder)).second)
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Module kind '{}' is already defined", kind));
    }
}

bool ModuleCatalog::has_kind(const std::string& kind) const
{
    return m_builders.count(kind) > 0;
}

std::vector<std::string> ModuleCatalog::kinds() const
{
    std::vector<std::string> result;
    result.reserve(m_builders.size());
    for (const auto& kv : m_builders)
    {
        result.push_back(kv.first);
    }
    return result;
}

ModuleRegistration ModuleCatalog::make_registration(const ModuleConfig& module) const
{
    auto it = m_builders.find(module.kind);
    if (it == m_builders.end())
    {
        throw PipelineError(
            PipelineErrorCode::ConfigurationError,
            fmt::format("Module '{}' has unknown kind '{}' (known kinds: {})",
                        module.id, module.kind, fmt::join(kinds(), ", ")));
    }
    ModuleFactory factory = it->second(module);
    if (!factory)
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Builder for kind '{}' returned no factory", module.kind));
    }
    return ModuleRegistration{module.to_descriptor(), std::move(factory)};
}

void ModuleCatalog::register_all(const PipelineConfig& config, ModuleRegistry& registry) const
{
    std::vector<ModuleRegistration> batch;
    batch.reserve(config.modules.size());
    for (const auto& module : config.modules)
    {
        batch.push_back(make_registration(module));
    }
    registry.register_modules(std::move(batch));
    LOG_F(INFO, "Registered {} configured module(s)", config.modules.size());
}

} // namespace modpipe
