#include "modpipe/common/cache_layer.hpp"
#include "modpipe/common/logging.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include <fmt/format.h>

namespace modpipe
{

/**
 * @brief One cache key.
 *
 * @details
 * `key_mutex` serializes computations for the key. Every other field is
 * guarded by the table mutex. A slot that has been removed from the table is
 * marked `detached`; callers still holding it restart their lookup.
 */
struct CacheLayer::Slot
{
    std::mutex key_mutex;

    CacheEntryState state{CacheEntryState::Absent};
    SharedValue value{};
    bool expires{false};
    Clock::time_point expires_at{};

    /// Number of finished computations, successful or not.
    uint64_t completions{0};

    /// Error of the most recent failed computation.
    std::exception_ptr last_error{};

    bool detached{false};
    bool in_lru{false};
    std::list<std::string>::iterator lru_pos{};
};

const char* to_string(CacheEntryState state) noexcept
{
    switch (state)
    {
    case CacheEntryState::Absent:
        return "Absent";
    case CacheEntryState::Pending:
        return "Pending";
    case CacheEntryState::Ready:
        return "Ready";
    }
    return "Unknown";
}

CacheLayer::CacheLayer(CacheConfig config)
    : m_config{std::move(config)}
{}

SharedValue CacheLayer::get_or_compute(const std::string& key,
                                       const ComputeFn& compute,
                                       CacheTtl ttl)
{
    for (;;)
    {
        SlotPtr slot;
        uint64_t observed_completions = 0;

        // Fast path: look up under the table mutex only.
        {
            std::lock_guard<std::mutex> table_lock{m_table_mutex};
            auto it = m_slots.find(key);
            if (it == m_slots.end())
            {
                slot = std::make_shared<Slot>();
                m_slots.emplace(key, slot);
            }
            else
            {
                slot = it->second;
                if (slot->state == CacheEntryState::Ready)
                {
                    if (!is_expired(*slot, now()))
                    {
                        touch(*slot, key);
                        ++m_stats.hits;
                        return slot->value;
                    }
                    LOG_F(2, "Cache entry '{}' expired", key);
                    ++m_stats.expirations;
                    if (slot->in_lru)
                    {
                        m_lru.erase(slot->lru_pos);
                        slot->in_lru = false;
                    }
                    slot->value.reset();
                    slot->state = CacheEntryState::Absent;
                }
            }
            observed_completions = slot->completions;
            ++m_stats.misses;
        }

        std::unique_lock<std::mutex> key_lock{slot->key_mutex};

        // Re-check after acquiring the key lock: another caller may have
        // finished the computation while this one waited.
        {
            std::lock_guard<std::mutex> table_lock{m_table_mutex};
            if (slot->detached)
            {
                continue;
            }
            if (slot->state == CacheEntryState::Ready && !is_expired(*slot, now()))
            {
                touch(*slot, key);
                return slot->value;
            }
            if (slot->completions != observed_completions && slot->last_error)
            {
                std::rethrow_exception(slot->last_error);
            }
            slot->state = CacheEntryState::Pending;
            slot->last_error = nullptr;
        }

        LOG_F(2, "Computing cache entry '{}'", key);

        SharedValue value;
        std::exception_ptr error;
        try
        {
            value = compute();
        }
        catch (const std::exception& e)
        {
            error = std::make_exception_ptr(PipelineError(
                PipelineErrorCode::ComputationFailed,
                fmt::format("Computation for cache key '{}' failed: {}", key, e.what())));
        }
        catch (...)
        {
            error = std::make_exception_ptr(PipelineError(
                PipelineErrorCode::ComputationFailed,
                fmt::format("Computation for cache key '{}' failed: unknown exception", key)));
        }

        std::lock_guard<std::mutex> table_lock{m_table_mutex};
        ++slot->completions;

        if (error)
        {
            ++m_stats.failures;
            slot->state = CacheEntryState::Absent;
            slot->last_error = error;
            // The waiters already hold the slot; new callers start fresh.
            auto it = m_slots.find(key);
            if (it != m_slots.end() && it->second == slot)
            {
                m_slots.erase(it);
            }
            LOG_F(WARNING, "Cache computation failed for key '{}'", key);
            std::rethrow_exception(error);
        }

        ++m_stats.computations;
        if (slot->detached)
        {
            // Invalidated while computing: hand the value to this caller only.
            return value;
        }

        slot->value = value;
        slot->state = CacheEntryState::Ready;
        // kProcessLifetime, like any TTL reaching past the end of the clock,
        // yields no deadline.
        auto expires_at = deadline_after(now(), ttl);
        slot->expires = expires_at.has_value();
        if (expires_at)
        {
            slot->expires_at = *expires_at;
        }
        touch(*slot, key);
        enforce_bound();
        return value;
    }
}

std::optional<SharedValue> CacheLayer::peek(const std::string& key) const
{
    std::lock_guard<std::mutex> table_lock{m_table_mutex};
    auto it = m_slots.find(key);
    if (it == m_slots.end())
    {
        return std::nullopt;
    }
    const Slot& slot = *it->second;
    if (slot.state != CacheEntryState::Ready || is_expired(slot, now()))
    {
        return std::nullopt;
    }
    return slot.value;
}

bool CacheLayer::invalidate(const std::string& key)
{
    std::lock_guard<std::mutex> table_lock{m_table_mutex};
    auto it = m_slots.find(key);
    if (it == m_slots.end())
    {
        return false;
    }
    SlotPtr slot = it->second;
    detach(key, *slot);
    return true;
}

void CacheLayer::clear()
{
    std::lock_guard<std::mutex> table_lock{m_table_mutex};
    while (!m_slots.empty())
    {
        auto it = m_slots.begin();
        SlotPtr slot = it->second;
        detach(it->first, *slot);
    }
    m_lru.clear();
}

CacheEntryState CacheLayer::state(const std::string& key) const
{
    std::lock_guard<std::mutex> table_lock{m_table_mutex};
    auto it = m_slots.find(key);
    if (it == m_slots.end())
    {
        return CacheEntryState::Absent;
    }
    const Slot& slot = *it->second;
    if (slot.state == CacheEntryState::Ready && is_expired(slot, now()))
    {
        return CacheEntryState::Absent;
    }
    return slot.state;
}

CacheStats CacheLayer::stats() const
{
    std::lock_guard<std::mutex> table_lock{m_table_mutex};
    CacheStats result = m_stats;
    result.entries = m_lru.size();
    return result;
}

Clock::time_point CacheLayer::now() const
{
    return m_config.now ? m_config.now() : Clock::now();
}

bool CacheLayer::is_expired(const Slot& slot, Clock::time_point now) const noexcept
{
    return slot.expires && now >= slot.expires_at;
}

void CacheLayer::touch(Slot& slot, const std::string& key)
{
    if (slot.in_lru)
    {
        m_lru.splice(m_lru.begin(), m_lru, slot.lru_pos);
    }
    else
    {
        m_lru.push_front(key);
        slot.lru_pos = m_lru.begin();
        slot.in_lru = true;
    }
}

void CacheLayer::detach(const std::string& key, Slot& slot)
{
    if (slot.in_lru)
    {
        m_lru.erase(slot.lru_pos);
        slot.in_lru = false;
    }
    slot.detached = true;
    slot.value.reset();
    slot.state = CacheEntryState::Absent;
    m_slots.erase(key);
}

void CacheLayer::enforce_bound()
{
    if (m_config.max_entries == 0)
    {
        return;
    }
    while (m_lru.size() > m_config.max_entries)
    {
        std::string victim = m_lru.back();
        auto it = m_slots.find(victim);
        if (it == m_slots.end())
        {
            m_lru.pop_back();
            continue;
        }
        SlotPtr slot = it->second;
        LOG_F(2, "Evicting cache entry '{}'", victim);
        detach(victim, *slot);
        ++m_stats.evictions;
    }
}

std::string cache_fingerprint(const std::string& function, const std::vector<std::string>& args)
{
    constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
    constexpr uint64_t kPrime = 1099511628211ull;

    uint64_t hash = kOffsetBasis;
    auto mix = [&hash](unsigned char byte) {
        hash ^= byte;
        hash *= kPrime;
    };
    for (const auto& arg : args)
    {
        // Length prefix keeps argument boundaries in the hash.
        uint64_t length = arg.size();
        for (int shift = 0; shift < 64; shift += 8)
        {
            mix(static_cast<unsigned char>((length >> shift) & 0xffu));
        }
        for (char c : arg)
        {
            mix(static_cast<unsigned char>(c));
        }
    }
    return fmt::format("{}:{:016x}", function, hash);
}

} // namespace modpipe
