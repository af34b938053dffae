/**
 * @file cache_layer.hpp
 * @brief Process-wide memoization with at-most-once computation per key.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/pipeline_enums.hpp"
#include "modpipe/common/shared_value.inline.hpp"
#include <list>

namespace modpipe
{

/**
 * @brief Time-to-live of a cache entry.
 */
using CacheTtl = std::chrono::milliseconds;

/**
 * @brief TTL value meaning "never expires".
 */
inline constexpr CacheTtl kProcessLifetime = CacheTtl::max();

/**
 * @brief Observable state of one cache key.
 */
enum class CacheEntryState
{
    Absent,   ///< No value stored (never computed, failed, expired or evicted).
    Pending,  ///< A computation is in progress.
    Ready     ///< A value is stored and has not expired.
};

const char* to_string(CacheEntryState state) noexcept;

/**
 * @brief Configuration for CacheLayer.
 */
struct CacheConfig
{
    /**
     * @brief Upper bound on Ready entries; 0 means unbounded.
     * @details When exceeded, the least recently used entry is evicted.
     */
    size_t max_entries{0};

    /**
     * @brief Clock override used for TTL checks.
     * @details Empty means `Clock::now()`.
     */
    std::function<Clock::time_point()> now{};
};

/**
 * @brief Counters reported by CacheLayer::stats().
 */
struct CacheStats
{
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t computations{0};
    uint64_t failures{0};
    uint64_t evictions{0};
    uint64_t expirations{0};

    /// Number of Ready entries currently stored.
    size_t entries{0};
};

/**
 * @brief Thread-safe memoization table shared by every run in the process.
 *
 * @details
 * `get_or_compute()` guarantees that among all callers observing a miss on the
 * same key concurrently, `compute` runs exactly once. The other callers block
 * on the key's lock and then receive the same value, or the same
 * `ComputationFailed` exception object, without computing.
 *
 * Each key owns a slot. The slot table is protected by one mutex which is only
 * held for bookkeeping. Each slot has its own mutex which is created with the
 * slot, taken only on a miss, and held across compute and store. Misses on
 * different keys therefore never wait for each other.
 *
 * Failures are never cached: once a failed computation has been reported to
 * the callers that were waiting on it, the next caller computes again.
 *
 * TTL expiry is lazy: an expired entry is discovered and dropped by the next
 * lookup. With `CacheConfig::max_entries` set, storing a new value evicts the
 * least recently used entries beyond the bound.
 *
 * @par Thread Safety
 * - All public methods are safe to call concurrently.
 * - `compute` runs on the calling thread, without the table mutex held. It
 *   may use the cache for other keys; using it for its own key deadlocks.
 */
class CacheLayer
{
public:
    using ComputeFn = std::function<SharedValue()>;

    explicit CacheLayer(CacheConfig config = {});

    CacheLayer(const CacheLayer&) = delete;
    CacheLayer& operator=(const CacheLayer&) = delete;

    /**
     * @brief Return the cached value for key, computing it on a miss.
     *
     * @param key Deterministic key, see `cache_fingerprint()`.
     * @param compute Computes the value; called at most once per miss.
     * @param ttl Lifetime of the stored value; `kProcessLifetime` never expires.
     * @return The stored value. Concurrent callers receive copies of one
     *         SharedValue referring to the same object.
     * @throws PipelineError with `ComputationFailed` if `compute` throws.
     */
    SharedValue get_or_compute(const std::string& key,
                               const ComputeFn& compute,
                               CacheTtl ttl = kProcessLifetime);

    /**
     * @brief Typed convenience wrapper around `get_or_compute()`.
     *
     * @details `compute` returns a T by value; it is stored as a SharedValue.
     * @throws SharedValueTypeError if the key already holds another type.
     */
    template <typename T, typename Fn>
    std::shared_ptr<const T> get_or_compute_as(const std::string& key,
                                               Fn&& compute,
                                               CacheTtl ttl = kProcessLifetime)
    {
        SharedValue value = get_or_compute(
            key,
            [&compute]() { return SharedValue::of<T>(compute()); },
            ttl);
        (void)value.as<T>();
        return value.get<T>();
    }

    /**
     * @brief Return the stored value without computing.
     * @return The value if Ready and not expired, nullopt otherwise.
     */
    std::optional<SharedValue> peek(const std::string& key) const;

    /**
     * @brief Drop the entry for key.
     * @return True if an entry was dropped.
     * @note A computation in progress still returns its value to its own
     *       caller, but the value is not stored.
     */
    bool invalidate(const std::string& key);

    /**
     * @brief Drop every entry.
     */
    void clear();

    /**
     * @brief Get the state of key.
     */
    CacheEntryState state(const std::string& key) const;

    CacheStats stats() const;

private:
    struct Slot;
    using SlotPtr = std::shared_ptr<Slot>;

    Clock::time_point now() const;
    bool is_expired(const Slot& slot, Clock::time_point now) const noexcept;
    void touch(Slot& slot, const std::string& key);
    void detach(const std::string& key, Slot& slot);
    void enforce_bound();

    CacheConfig m_config;

    mutable std::mutex m_table_mutex;
    std::unordered_map<std::string, SlotPtr> m_slots;

    /// Keys of Ready slots; front is the most recently used.
    std::list<std::string> m_lru;

    CacheStats m_stats;
};

/**
 * @brief Build a deterministic cache key for a function and its arguments.
 *
 * @details
 * The result is `<function>:<16 hex digits>`, where the digits are a 64-bit
 * FNV-1a hash of the arguments. Argument boundaries are part of the hash, so
 * `{"ab", "c"}` and `{"a", "bc"}` produce different keys.
 */
std::string cache_fingerprint(const std::string& function, const std::vector<std::string>& args);

} // namespace modpipe
