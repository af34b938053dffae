#include "modpipe/common/shared_state.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include <fmt/format.h>

namespace modpipe
{

// ============================================================================
// SharedStateStore
// ============================================================================

SharedStateStore::SharedStateStore(StateMap initial)
    : m_published{std::make_shared<StateMap>(std::move(initial))}
{}

std::optional<SharedValue> SharedStateStore::get(const StateKey& key) const
{
    auto it = m_published->find(key);
    if (it == m_published->end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool SharedStateStore::contains(const StateKey& key) const
{
    return m_published->count(key) > 0;
}

void SharedStateStore::stage(const ModuleDescriptor& writer, const StateMap& writes)
{
    for (const auto& kv : writes)
    {
        if (!writer.produces(kv.first))
        {
            throw PipelineError(
                PipelineErrorCode::UndeclaredStateAccess,
                fmt::format("Module '{}' wrote undeclared key '{}'", writer.id, kv.first));
        }
        if (m_published->count(kv.first) > 0 || m_staged.count(kv.first) > 0)
        {
            throw PipelineError(
                PipelineErrorCode::DuplicateKeyProducer,
                fmt::format("Module '{}' wrote key '{}' which already has a value",
                            writer.id, kv.first));
        }
    }
    for (const auto& kv : writes)
    {
        m_staged.emplace(kv.first, kv.second);
    }
}

size_t SharedStateStore::commit()
{
    if (m_staged.empty())
    {
        return 0;
    }
    auto next = std::make_shared<StateMap>(*m_published);
    size_t count = m_staged.size();
    next->merge(m_staged);
    m_staged.clear();
    m_published = std::move(next);
    return count;
}

// ============================================================================
// ModuleContext
// ============================================================================

ModuleContext::ModuleContext(ModuleDescriptorPtr descriptor,
                             StateSnapshot snapshot,
                             std::shared_ptr<CacheLayer> cache,
                             std::shared_ptr<std::atomic<bool>> stop_flag)
    : m_descriptor{std::move(descriptor)}
    , m_snapshot{std::move(snapshot)}
    , m_cache{std::move(cache)}
    , m_stop_flag{std::move(stop_flag)}
{
    if (!m_snapshot)
    {
        m_snapshot = std::make_shared<StateMap>();
    }
}

std::optional<SharedValue> ModuleContext::get(const StateKey& key) const
{
    if (!m_descriptor->consumes(key))
    {
        throw PipelineError(
            PipelineErrorCode::UndeclaredStateAccess,
            fmt::format("Module '{}' read undeclared key '{}'", m_descriptor->id, key));
    }
    auto it = m_snapshot->find(key);
    if (it == m_snapshot->end())
    {
        return std::nullopt;
    }
    return it->second;
}

CacheLayer& ModuleContext::cache() const
{
    if (!m_cache)
    {
        throw PipelineError(
            PipelineErrorCode::ConfigurationError,
            fmt::format("Module '{}' has no cache layer", m_descriptor->id));
    }
    return *m_cache;
}

} // namespace modpipe
