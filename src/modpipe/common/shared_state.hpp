/**
 * @file shared_state.hpp
 * @brief Per-run shared state and the context handed to modules.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/cache_layer.hpp"
#include "modpipe/common/content_module.hpp"
#include "modpipe/common/module_descriptor.hpp"
#include "modpipe/common/shared_value.inline.hpp"

namespace modpipe
{

using StateSnapshot = std::shared_ptr<const StateMap>;

// ============================================================================
// SharedStateStore
// ============================================================================

/**
 * @brief Key/value context scoped to one pipeline run.
 *
 * @details
 * The store publishes its contents as immutable snapshots. Writes of a wave
 * are staged while the wave runs and become visible, as one new snapshot,
 * when the orchestrator commits them at the wave barrier. A module therefore
 * only ever reads the snapshot that existed when its wave began, and readers
 * never need a lock.
 *
 * Every key has at most one writer per run: staging a key that is already
 * present (in the initial context, an earlier wave, or the staged set) fails
 * with `DuplicateKeyProducer`.
 *
 * @par Thread safety
 * - Not synchronized. Owned and mutated by the orchestrating thread only.
 * - Snapshots returned by `snapshot()` are immutable and may be read from any
 *   thread.
 */
class SharedStateStore
{
public:
    explicit SharedStateStore(StateMap initial = {});

    /**
     * @brief Get the currently published snapshot.
     */
    StateSnapshot snapshot() const noexcept
    {
        return m_published;
    }

    /**
     * @brief Look up a key in the published snapshot.
     * @return The value, or nullopt if the key is missing.
     */
    std::optional<SharedValue> get(const StateKey& key) const;

    bool contains(const StateKey& key) const;

    size_t size() const noexcept
    {
        return m_published->size();
    }

    /**
     * @brief Validate and stage the writes of one module.
     *
     * @details The write set is validated as a whole; on error nothing is
     *          staged.
     * @throws PipelineError with `UndeclaredStateAccess` if a key is not one of
     *         the writer's produced keys.
     * @throws PipelineError with `DuplicateKeyProducer` if a key already has a
     *         value in this run.
     */
    void stage(const ModuleDescriptor& writer, const StateMap& writes);

    /**
     * @brief Publish the staged writes as a new snapshot.
     * @return Number of keys published.
     */
    size_t commit();

private:
    StateSnapshot m_published;
    StateMap m_staged;
};

// ============================================================================
// ModuleContext
// ============================================================================

/**
 * @brief Everything one module execution may observe.
 *
 * @details
 * A context is created per module per run. It exposes the shared-state
 * snapshot of the module's wave, filtered by the module's declared consumed
 * keys, the process-wide cache, and a cooperative stop flag raised when the
 * module times out or the run is cancelled.
 *
 * @par Thread safety
 * - All accessors are const and safe to call from the worker thread.
 */
class ModuleContext
{
public:
    ModuleContext(ModuleDescriptorPtr descriptor,
                  StateSnapshot snapshot,
                  std::shared_ptr<CacheLayer> cache,
                  std::shared_ptr<std::atomic<bool>> stop_flag);

    const ModuleDescriptor& descriptor() const noexcept
    {
        return *m_descriptor;
    }

    /**
     * @brief Read a shared-state value.
     * @return The value, or nullopt if no module produced it (yet).
     * @throws PipelineError with `UndeclaredStateAccess` if the key is not one
     *         of this module's consumed keys.
     */
    std::optional<SharedValue> get(const StateKey& key) const;

    /**
     * @brief Read a shared-state value as T.
     * @return Pointer to the value, or nullptr if missing or of another type.
     * @throws PipelineError with `UndeclaredStateAccess` as `get()`.
     */
    template <typename T>
    std::shared_ptr<const T> get_as(const StateKey& key) const
    {
        auto value = get(key);
        if (!value)
        {
            return nullptr;
        }
        return value->get<T>();
    }

    /**
     * @brief Check whether a consumed key has a value.
     */
    bool has(const StateKey& key) const
    {
        return get(key).has_value();
    }

    /**
     * @brief Access the process-wide cache.
     * @throws PipelineError with `ConfigurationError` if no cache was given.
     */
    CacheLayer& cache() const;

    /**
     * @brief Check whether the module should stop early.
     */
    bool stop_requested() const noexcept
    {
        return m_stop_flag && m_stop_flag->load(std::memory_order_acquire);
    }

private:
    ModuleDescriptorPtr m_descriptor;
    StateSnapshot m_snapshot;
    std::shared_ptr<CacheLayer> m_cache;
    std::shared_ptr<std::atomic<bool>> m_stop_flag;
};

} // namespace modpipe
