#include "modpipe/common/module_registry.hpp"
#include "modpipe/common/dependency_resolver.hpp"
#include "modpipe/common/logging.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include <fmt/format.h>

namespace modpipe
{

namespace
{

PipelineErrorCode error_code_for(DiagnosticCategory category)
{
    switch (category)
    {
    case DiagnosticCategory::Cycle:
        return PipelineErrorCode::CyclicDependency;
    case DiagnosticCategory::UnknownDependency:
        return PipelineErrorCode::UnknownDependency;
    case DiagnosticCategory::DuplicateKeyProducer:
        return PipelineErrorCode::DuplicateKeyProducer;
    case DiagnosticCategory::DuplicateModuleId:
        return PipelineErrorCode::DuplicateModuleId;
    case DiagnosticCategory::UnproducedKey:
        break;
    }
    return PipelineErrorCode::ConfigurationError;
}

DiagnosticItem make_error(DiagnosticCategory category, std::string message)
{
    DiagnosticItem item;
    item.severity = DiagnosticSeverity::Error;
    item.category = category;
    item.message = std::move(message);
    return item;
}

} // namespace

void ModuleRegistry::register_module(ModuleDescriptor descriptor, ModuleFactory factory)
{
    std::vector<ModuleRegistration> batch;
    batch.push_back(ModuleRegistration{std::move(descriptor), std::move(factory)});
    register_modules(std::move(batch));
}

void ModuleRegistry::register_modules(std::vector<ModuleRegistration> batch)
{
    std::vector<ModuleDescriptorPtr> descriptors;
    descriptors.reserve(batch.size());
    for (auto& reg : batch)
    {
        if (!reg.factory)
        {
            throw PipelineError(
                PipelineErrorCode::ConfigurationError,
                fmt::format("Module '{}' has no factory", reg.descriptor.id));
        }
        descriptors.push_back(std::make_shared<ModuleDescriptor>(std::move(reg.descriptor)));
    }

    std::unique_lock<std::shared_mutex> lock{m_mutex};

    auto diagnostics = validate(descriptors);
    for (const auto& warning : diagnostics->warnings())
    {
        LOG_F(WARNING, "{}", warning.message);
    }
    if (diagnostics->has_errors())
    {
        const auto& first = diagnostics->errors().front();
        std::string message = first.message;
        if (diagnostics->errors().size() > 1)
        {
            message += fmt::format(" (and {} more error(s))", diagnostics->errors().size() - 1);
        }
        LOG_F(ERROR, "Module registration rejected: {}", message);
        throw RegistrationError(error_code_for(first.category), message, std::move(diagnostics));
    }

    for (size_t i = 0; i < descriptors.size(); ++i)
    {
        auto entry = std::make_unique<Entry>();
        entry->descriptor = descriptors[i];
        entry->factory = std::move(batch[i].factory);
        entry->index = m_entries.size();
        for (const auto& key : entry->descriptor->produced_keys)
        {
            m_producers.emplace(key, entry->descriptor->id);
        }
        m_by_id.emplace(entry->descriptor->id, entry.get());
        LOG_F(2, "Registered module '{}' (priority {})",
              entry->descriptor->id, entry->descriptor->priority);
        m_entries.push_back(std::move(entry));
    }
    LOG_F(1, "Registered {} module(s); registry holds {}", descriptors.size(), m_entries.size());
}

std::shared_ptr<PipelineDiagnostics> ModuleRegistry::validate(
    const std::vector<ModuleDescriptorPtr>& batch) const
{
    auto diagnostics = std::make_shared<PipelineDiagnostics>();

    std::set<ModuleId> batch_ids;
    std::map<StateKey, ModuleId> producers = m_producers;
    for (const auto& d : batch)
    {
        if (m_by_id.count(d->id) > 0 || !batch_ids.insert(d->id).second)
        {
            auto item = make_error(DiagnosticCategory::DuplicateModuleId,
                                   fmt::format("Module id '{}' is registered more than once", d->id));
            item.involved_modules.push_back(d->id);
            diagnostics->add(std::move(item));
        }
        for (const auto& key : d->produced_keys)
        {
            auto [it, inserted] = producers.emplace(key, d->id);
            if (!inserted)
            {
                auto item = make_error(
                    DiagnosticCategory::DuplicateKeyProducer,
                    fmt::format("Key '{}' is produced by both '{}' and '{}'", key, it->second, d->id));
                item.involved_modules = {it->second, d->id};
                item.key = key;
                diagnostics->add(std::move(item));
            }
        }
    }

    for (const auto& d : batch)
    {
        for (const auto& dep : d->dependencies)
        {
            if (m_by_id.count(dep) == 0 && batch_ids.count(dep) == 0)
            {
                auto item = make_error(
                    DiagnosticCategory::UnknownDependency,
                    fmt::format("Module '{}' depends on unknown module '{}'", d->id, dep));
                item.involved_modules = {d->id, dep};
                diagnostics->add(std::move(item));
            }
        }
        for (const auto& key : d->consumed_keys)
        {
            if (producers.count(key) == 0)
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Warning;
                item.category = DiagnosticCategory::UnproducedKey;
                item.message = fmt::format(
                    "Module '{}' consumes key '{}' which no module produces", d->id, key);
                item.involved_modules.push_back(d->id);
                item.key = key;
                diagnostics->add(std::move(item));
            }
        }
    }

    // Duplicate ids make the combined graph ill-defined.
    if (diagnostics->find_error(DiagnosticCategory::DuplicateModuleId) == nullptr)
    {
        std::vector<ModuleDescriptorPtr> combined;
        combined.reserve(m_entries.size() + batch.size());
        for (const auto& entry : m_entries)
        {
            combined.push_back(entry->descriptor);
        }
        combined.insert(combined.end(), batch.begin(), batch.end());
        DependencyResolver::check_acyclic(combined, *diagnostics);
    }

    return diagnostics;
}

bool ModuleRegistry::contains(const ModuleId& id) const
{
    std::shared_lock<std::shared_mutex> lock{m_mutex};
    return m_by_id.count(id) > 0;
}

size_t ModuleRegistry::size() const
{
    std::shared_lock<std::shared_mutex> lock{m_mutex};
    return m_entries.size();
}

const ModuleRegistry::Entry& ModuleRegistry::find_entry(const ModuleId& id) const
{
    std::shared_lock<std::shared_mutex> lock{m_mutex};
    auto it = m_by_id.find(id);
    if (it == m_by_id.end())
    {
        throw PipelineError(PipelineErrorCode::UnknownModule,
                            fmt::format("Module '{}' is not registered", id));
    }
    return *it->second;
}

ModuleDescriptorPtr ModuleRegistry::descriptor(const ModuleId& id) const
{
    return find_entry(id).descriptor;
}

size_t ModuleRegistry::registration_index(const ModuleId& id) const
{
    return find_entry(id).index;
}

std::vector<ModuleId> ModuleRegistry::module_ids() const
{
    std::shared_lock<std::shared_mutex> lock{m_mutex};
    std::vector<ModuleId> ids;
    ids.reserve(m_entries.size());
    for (const auto& entry : m_entries)
    {
        ids.push_back(entry->descriptor->id);
    }
    return ids;
}

std::vector<ModuleDescriptorPtr> ModuleRegistry::descriptors() const
{
    std::shared_lock<std::shared_mutex> lock{m_mutex};
    std::vector<ModuleDescriptorPtr> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries)
    {
        result.push_back(entry->descriptor);
    }
    return result;
}

std::vector<ModuleDescriptorPtr> ModuleRegistry::modules_by_priority() const
{
    auto result = descriptors();
    std::sort(result.begin(), result.end(),
              [](const ModuleDescriptorPtr& a, const ModuleDescriptorPtr& b) {
                  if (a->priority != b->priority)
                  {
                      return a->priority < b->priority;
                  }
                  return a->id < b->id;
              });
    return result;
}

std::optional<ModuleId> ModuleRegistry::producer_of(const StateKey& key) const
{
    std::shared_lock<std::shared_mutex> lock{m_mutex};
    auto it = m_producers.find(key);
    if (it == m_producers.end())
    {
        return std::nullopt;
    }
    return it->second;
}

ContentModulePtr ModuleRegistry::instance(const ModuleId& id) const
{
    // Entries are never removed, so the reference stays valid without the lock.
    const Entry& entry = find_entry(id);
    std::call_once(entry.created, [&entry]() {
        auto created = entry.factory(*entry.descriptor);
        if (!created)
        {
            throw PipelineError(
                PipelineErrorCode::ConfigurationError,
                fmt::format("Factory of module '{}' returned no instance", entry.descriptor->id));
        }
        LOG_F(2, "Created instance of module '{}' ({})", entry.descriptor->id, created->class_name());
        entry.instance = std::move(created);
    });
    return entry.instance;
}

} // namespace modpipe
