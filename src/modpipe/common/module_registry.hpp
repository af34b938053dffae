/**
 * @file module_registry.hpp
 * @brief Registry of module descriptors and their singleton instances.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/content_module.hpp"
#include "modpipe/common/module_descriptor.hpp"
#include "modpipe/common/pipeline_diagnostics.hpp"
#include <shared_mutex>

namespace modpipe
{

/**
 * @brief One descriptor plus the factory of its module.
 */
struct ModuleRegistration
{
    ModuleDescriptor descriptor;
    ModuleFactory factory;
};

/**
 * @brief Holds module descriptors and lazily created module singletons.
 *
 * @details
 * Registration validates the new descriptors against everything already
 * registered. A batch passed to `register_modules()` is validated as a whole,
 * so modules inside one batch may depend on each other in any order. When
 * validation fails, nothing from the batch is registered and a
 * `RegistrationError` is thrown, carrying every problem found.
 *
 * @par Validation
 * Errors (reject the batch):
 * - `DuplicateModuleId`: id already registered or repeated in the batch.
 * - `DuplicateKeyProducer`: a produced key already has a producer.
 * - `UnknownDependency`: a dependency names no registered or batch module.
 * - `CyclicDependency`: explicit and implicit edges form a cycle.
 *
 * Warnings (logged only):
 * - `UnproducedKey`: a consumed key has no producer. This is expected for
 *   keys supplied by the initial context.
 *
 * @par Thread safety
 * - All methods are safe to call concurrently.
 * - `instance()` calls the factory at most once per module, even under
 *   concurrent calls. A factory that throws is retried by the next call.
 */
class ModuleRegistry
{
public:
    ModuleRegistry() = default;

    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    /**
     * @brief Register a single module.
     * @throws RegistrationError as described in the class documentation.
     * @throws PipelineError with `ConfigurationError` if factory is empty.
     */
    void register_module(ModuleDescriptor descriptor, ModuleFactory factory);

    /**
     * @brief Register several modules atomically.
     * @throws RegistrationError as described in the class documentation.
     * @throws PipelineError with `ConfigurationError` if a factory is empty.
     */
    void register_modules(std::vector<ModuleRegistration> batch);

    bool contains(const ModuleId& id) const;

    size_t size() const;

    /**
     * @brief Get a descriptor.
     * @throws PipelineError with `UnknownModule` if id is not registered.
     */
    ModuleDescriptorPtr descriptor(const ModuleId& id) const;

    /**
     * @brief Get the position of a module in registration order.
     * @throws PipelineError with `UnknownModule` if id is not registered.
     */
    size_t registration_index(const ModuleId& id) const;

    /**
     * @brief Get all ids in registration order.
     */
    std::vector<ModuleId> module_ids() const;

    /**
     * @brief Get all descriptors in registration order.
     */
    std::vector<ModuleDescriptorPtr> descriptors() const;

    /**
     * @brief Get all descriptors by ascending priority, then id.
     */
    std::vector<ModuleDescriptorPtr> modules_by_priority() const;

    /**
     * @brief Find the module producing a key.
     */
    std::optional<ModuleId> producer_of(const StateKey& key) const;

    /**
     * @brief Get the singleton instance of a module, creating it on first use.
     * @throws PipelineError with `UnknownModule` if id is not registered.
     * @throws PipelineError with `ConfigurationError` if the factory returns
     *         null. Exceptions thrown by the factory propagate unchanged.
     */
    ContentModulePtr instance(const ModuleId& id) const;

private:
    struct Entry
    {
        ModuleDescriptorPtr descriptor;
        ModuleFactory factory;
        size_t index{0};
        mutable std::once_flag created;
        mutable ContentModulePtr instance;
    };

    const Entry& find_entry(const ModuleId& id) const;

    std::shared_ptr<PipelineDiagnostics> validate(
        const std::vector<ModuleDescriptorPtr>& batch) const;

    mutable std::shared_mutex m_mutex;
    std::vector<std::unique_ptr<Entry>> m_entries;
    std::unordered_map<ModuleId, const Entry*> m_by_id;
    std::map<StateKey, ModuleId> m_producers;
};

} // namespace modpipe
