/**
 * @file module_descriptor.hpp
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/pipeline_enums.hpp"

namespace modpipe
{

/**
 * @brief Static description of one content module.
 *
 * @details
 * Descriptors are created once at startup from static configuration and are
 * immutable after registration. The registry enforces:
 * - ids are unique,
 * - every dependency id names a registered module,
 * - the dependency graph is acyclic,
 * - at most one descriptor declares a given produced key.
 *
 * Ordered sets are used throughout so that iteration order, and therefore
 * every derived plan and diagnostic, is deterministic.
 */
struct ModuleDescriptor
{
    /// Unique id.
    ModuleId id;

    /// Display name; falls back to the id when empty.
    std::string name;

    /// Lower priority is emitted earlier in the artifact.
    int priority{0};

    /// Ids of modules that must complete in an earlier wave.
    std::set<ModuleId> dependencies;

    /// Shared-state keys this module may write.
    std::set<StateKey> produced_keys;

    /// Shared-state keys this module may read.
    std::set<StateKey> consumed_keys;

    /// A failing required module marks the run PartialFailure and stops
    /// dispatch of later waves.
    bool required{false};

    /// Per-module timeout; zero means the orchestrator default applies.
    std::chrono::milliseconds timeout{0};

    bool produces(const StateKey& key) const
    {
        return produced_keys.count(key) > 0;
    }

    bool consumes(const StateKey& key) const
    {
        return consumed_keys.count(key) > 0;
    }

    const std::string& display_name() const noexcept
    {
        return name.empty() ? id : name;
    }
};

using ModuleDescriptorPtr = std::shared_ptr<const ModuleDescriptor>;

} // namespace modpipe
