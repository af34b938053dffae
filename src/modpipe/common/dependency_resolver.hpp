/**
 * @file dependency_resolver.hpp
 * @brief Topological sort of module descriptors into concurrency waves.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/module_descriptor.hpp"
#include "modpipe/common/pipeline_diagnostics.hpp"

namespace modpipe
{

/**
 * @brief Ordered waves of module ids.
 *
 * @details
 * Every module of wave N depends only on modules of waves 0..N-1. Within a
 * wave, ids are ordered by descending priority, then ascending id; this is the
 * dispatch order.
 */
struct WavePlan
{
    std::vector<std::vector<ModuleId>> waves;

    size_t wave_count() const noexcept
    {
        return waves.size();
    }

    size_t module_count() const noexcept
    {
        size_t count = 0;
        for (const auto& wave : waves)
        {
            count += wave.size();
        }
        return count;
    }

    /**
     * @brief Find the wave index of a module.
     * @return The index, or nullopt if the module is not in the plan.
     */
    std::optional<size_t> wave_of(const ModuleId& id) const
    {
        for (size_t w = 0; w < waves.size(); ++w)
        {
            if (std::find(waves[w].begin(), waves[w].end(), id) != waves[w].end())
            {
                return w;
            }
        }
        return std::nullopt;
    }
};

using WavePlanPtr = std::shared_ptr<const WavePlan>;

/**
 * @brief Computes wave plans with Kahn's algorithm.
 *
 * @details
 * The edge set combines:
 * - explicit edges, from each id in `dependencies` to the dependent module;
 * - implicit edges, from the producer of a key to every module in the set
 *   that consumes it.
 *
 * Dependencies on ids that are not part of the given set are ignored: the
 * resolver plans a subset of the registry, and a module whose dependency was
 * not selected simply observes missing shared-state keys.
 *
 * A plan is a pure function of the descriptor set, so callers may reuse it for
 * every run over the same set.
 *
 * @par Thread safety
 * - Stateless; safe to call from any thread.
 */
class DependencyResolver
{
public:
    /**
     * @brief Sort descriptors into waves.
     * @param descriptors The module set; ids must be unique.
     * @throws RegistrationError with `CyclicDependency` if some modules can
     *         never become ready. The diagnostics name exactly the modules on a
     *         cycle in `involved_modules` and the modules stuck behind them in
     *         `blocked_modules`, both sorted by id.
     * @throws PipelineError with `DuplicateModuleId` if an id appears twice.
     */
    static WavePlan resolve(const std::vector<ModuleDescriptorPtr>& descriptors);

    /**
     * @brief Run cycle detection only, adding any finding to diagnostics.
     * @return True if the set is acyclic.
     */
    static bool check_acyclic(const std::vector<ModuleDescriptorPtr>& descriptors,
                              PipelineDiagnostics& diagnostics);
};

} // namespace modpipe
