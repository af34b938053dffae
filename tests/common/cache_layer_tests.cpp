/**
 * @file cache_layer_tests.cpp
 * @brief Tests for CacheLayer: single computation per key, failures, expiry and eviction.
 */
#include <gtest/gtest.h>
#include "modpipe/common/cache_layer.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include <thread>

using namespace modpipe;

namespace
{

/**
 * @brief Manually advanced clock for expiry tests.
 */
struct FakeClock
{
    Clock::time_point now{Clock::time_point{} + std::chrono::hours(1)};

    std::function<Clock::time_point()> source()
    {
        return [this]() { return now; };
    }
};

} // namespace

// =============================================================================
// Basic lookup
// =============================================================================

TEST(CacheLayerTests, GetOrCompute_FirstCallComputes)
{
    CacheLayer cache;
    int calls = 0;
    auto value = cache.get_or_compute("k", [&]() {
        ++calls;
        return SharedValue::of(std::string("v"));
    });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(value.as<std::string>(), "v");
    EXPECT_EQ(cache.state("k"), CacheEntryState::Ready);
}

TEST(CacheLayerTests, GetOrCompute_SecondCallHitsCache)
{
    CacheLayer cache;
    int calls = 0;
    auto compute = [&]() {
        ++calls;
        return SharedValue::of(calls);
    };
    auto first = cache.get_or_compute("k", compute);
    auto second = cache.get_or_compute("k", compute);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(first.same_object(second));

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.computations, 1u);
    EXPECT_EQ(stats.entries, 1u);
}

TEST(CacheLayerTests, GetOrCompute_DistinctKeysComputeSeparately)
{
    CacheLayer cache;
    auto a = cache.get_or_compute("a", []() { return SharedValue::of(1); });
    auto b = cache.get_or_compute("b", []() { return SharedValue::of(2); });
    EXPECT_EQ(a.as<int>(), 1);
    EXPECT_EQ(b.as<int>(), 2);
    EXPECT_EQ(cache.stats().entries, 2u);
}

TEST(CacheLayerTests, GetOrComputeAs_ReturnsTypedPointer)
{
    CacheLayer cache;
    auto first = cache.get_or_compute_as<std::vector<int>>("list", []() { return std::vector<int>{1, 2}; });
    auto second = cache.get_or_compute_as<std::vector<int>>("list", []() { return std::vector<int>{}; });
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->size(), 2u);
    EXPECT_EQ(first, second);
}

TEST(CacheLayerTests, GetOrComputeAs_WrongStoredTypeThrows)
{
    CacheLayer cache;
    (void)cache.get_or_compute("k", []() { return SharedValue::of(1); });
    EXPECT_THROW((void)cache.get_or_compute_as<std::string>("k", []() { return std::string(); }),
                 SharedValueTypeError);
}

TEST(CacheLayerTests, Peek_DoesNotCompute)
{
    CacheLayer cache;
    EXPECT_FALSE(cache.peek("k").has_value());
    (void)cache.get_or_compute("k", []() { return SharedValue::of(3); });
    auto peeked = cache.peek("k");
    ASSERT_TRUE(peeked.has_value());
    EXPECT_EQ(peeked->as<int>(), 3);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST(CacheLayerTests, GetOrCompute_ConcurrentMiss_ComputesOnce)
{
    CacheLayer cache;
    std::atomic<int> calls{0};
    constexpr int kThreads = 4;

    std::vector<SharedValue> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&, i]() {
            results[i] = cache.get_or_compute("rules:ESS", [&]() {
                ++calls;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                return SharedValue::of(std::string("loaded"));
            });
        });
    }
    for (auto& t : threads)
    {
        t.join();
    }

    EXPECT_EQ(calls.load(), 1);
    for (int i = 1; i < kThreads; ++i)
    {
        EXPECT_TRUE(results[0].same_object(results[i]));
    }
    EXPECT_EQ(cache.stats().computations, 1u);
}

TEST(CacheLayerTests, GetOrCompute_DifferentKeysDoNotBlockEachOther)
{
    CacheLayer cache;
    std::atomic<bool> slow_started{false};
    std::atomic<bool> release{false};

    std::thread slow([&]() {
        (void)cache.get_or_compute("slow", [&]() {
            slow_started = true;
            while (!release)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return SharedValue::of(1);
        });
    });
    while (!slow_started)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    EXPECT_EQ(cache.state("slow"), CacheEntryState::Pending);
    auto fast = cache.get_or_compute("fast", []() { return SharedValue::of(2); });
    EXPECT_EQ(fast.as<int>(), 2);

    release = true;
    slow.join();
    EXPECT_EQ(cache.state("slow"), CacheEntryState::Ready);
}

// =============================================================================
// Failures
// =============================================================================

TEST(CacheLayerTests, GetOrCompute_FailureIsReportedAsComputationFailed)
{
    CacheLayer cache;
    try
    {
        (void)cache.get_or_compute("k", []() -> SharedValue { throw std::runtime_error("disk"); });
        FAIL() << "Expected PipelineError";
    }
    catch (const PipelineError& e)
    {
        EXPECT_EQ(e.code(), PipelineErrorCode::ComputationFailed);
        EXPECT_NE(std::string(e.what()).find("disk"), std::string::npos);
    }
    EXPECT_EQ(cache.state("k"), CacheEntryState::Absent);
    EXPECT_EQ(cache.stats().failures, 1u);
}

TEST(CacheLayerTests, GetOrCompute_FailureIsNotCached)
{
    CacheLayer cache;
    int calls = 0;
    auto compute = [&]() -> SharedValue {
        if (++calls == 1)
        {
            throw std::runtime_error("transient");
        }
        return SharedValue::of(calls);
    };
    EXPECT_THROW((void)cache.get_or_compute("k", compute), PipelineError);
    auto value = cache.get_or_compute("k", compute);
    EXPECT_EQ(value.as<int>(), 2);
    EXPECT_EQ(calls, 2);
}

TEST(CacheLayerTests, GetOrCompute_WaitersReceiveSameFailure)
{
    CacheLayer cache;
    std::atomic<int> calls{0};
    std::atomic<int> errors{0};
    constexpr int kThreads = 4;

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&]() {
            try
            {
                (void)cache.get_or_compute("k", [&]() -> SharedValue {
                    ++calls;
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    throw std::runtime_error("broken");
                });
            }
            catch (const PipelineError& e)
            {
                if (e.code() == PipelineErrorCode::ComputationFailed)
                {
                    ++errors;
                }
            }
        });
    }
    for (auto& t : threads)
    {
        t.join();
    }

    EXPECT_EQ(errors.load(), kThreads);
    // Threads that arrive after the failure start a fresh computation, so
    // only an upper bound holds under scheduling noise.
    EXPECT_GE(calls.load(), 1);
    EXPECT_LE(calls.load(), kThreads);
    EXPECT_EQ(cache.state("k"), CacheEntryState::Absent);
}

// =============================================================================
// Expiry
// =============================================================================

TEST(CacheLayerTests, Ttl_EntryExpiresAndRecomputes)
{
    FakeClock clock;
    CacheConfig config;
    config.now = clock.source();
    CacheLayer cache{config};

    int calls = 0;
    auto compute = [&]() { return SharedValue::of(++calls); };

    (void)cache.get_or_compute("k", compute, std::chrono::milliseconds(100));
    clock.now += std::chrono::milliseconds(50);
    EXPECT_EQ(cache.get_or_compute("k", compute, std::chrono::milliseconds(100)).as<int>(), 1);

    clock.now += std::chrono::milliseconds(60);
    EXPECT_EQ(cache.state("k"), CacheEntryState::Absent);
    EXPECT_FALSE(cache.peek("k").has_value());
    EXPECT_EQ(cache.get_or_compute("k", compute, std::chrono::milliseconds(100)).as<int>(), 2);
    EXPECT_EQ(cache.stats().expirations, 1u);
}

TEST(CacheLayerTests, ProcessLifetime_NeverExpires)
{
    FakeClock clock;
    CacheConfig config;
    config.now = clock.source();
    CacheLayer cache{config};

    (void)cache.get_or_compute("k", []() { return SharedValue::of(1); }, kProcessLifetime);
    clock.now += std::chrono::hours(24 * 365);
    EXPECT_EQ(cache.state("k"), CacheEntryState::Ready);
}

TEST(CacheLayerTests, Ttl_BeyondClockRange_NeverExpires)
{
    FakeClock clock;
    CacheConfig config;
    config.now = clock.source();
    CacheLayer cache{config};

    const auto four_centuries = std::chrono::duration_cast<CacheTtl>(std::chrono::hours(24 * 365 * 400));
    (void)cache.get_or_compute("k", []() { return SharedValue::of(1); }, four_centuries);
    EXPECT_EQ(cache.state("k"), CacheEntryState::Ready);
    ASSERT_TRUE(cache.peek("k").has_value());

    clock.now += std::chrono::hours(24 * 365 * 100);
    EXPECT_EQ(cache.state("k"), CacheEntryState::Ready);
}

TEST(CacheLayerTests, Ttl_LongButRepresentable_StillExpires)
{
    FakeClock clock;
    CacheConfig config;
    config.now = clock.source();
    CacheLayer cache{config};

    const auto century = std::chrono::duration_cast<CacheTtl>(std::chrono::hours(24 * 365 * 100));
    (void)cache.get_or_compute("k", []() { return SharedValue::of(1); }, century);
    clock.now += std::chrono::hours(24 * 365 * 50);
    EXPECT_EQ(cache.state("k"), CacheEntryState::Ready);
    clock.now += std::chrono::hours(24 * 365 * 51);
    EXPECT_EQ(cache.state("k"), CacheEntryState::Absent);
}

TEST(CacheLayerTests, DeadlineAfter_SaturatesAtClockRange)
{
    const Clock::time_point start{Clock::duration{0}};
    EXPECT_EQ(deadline_after(start, std::chrono::milliseconds(5)), start + std::chrono::milliseconds(5));
    EXPECT_FALSE(deadline_after(start, std::chrono::milliseconds::max()).has_value());
    EXPECT_FALSE(deadline_after(Clock::time_point::max() - std::chrono::seconds(1),
                                std::chrono::seconds(2)).has_value());
    EXPECT_EQ(saturating_duration(std::chrono::milliseconds(10'000'000'000'000)), Clock::duration::max());
}

// =============================================================================
// Invalidation and eviction
// =============================================================================

TEST(CacheLayerTests, Invalidate_ForcesRecompute)
{
    CacheLayer cache;
    int calls = 0;
    auto compute = [&]() { return SharedValue::of(++calls); };
    (void)cache.get_or_compute("k", compute);

    EXPECT_TRUE(cache.invalidate("k"));
    EXPECT_FALSE(cache.invalidate("k"));
    EXPECT_EQ(cache.state("k"), CacheEntryState::Absent);
    EXPECT_EQ(cache.get_or_compute("k", compute).as<int>(), 2);
}

TEST(CacheLayerTests, Clear_RemovesAllEntries)
{
    CacheLayer cache;
    (void)cache.get_or_compute("a", []() { return SharedValue::of(1); });
    (void)cache.get_or_compute("b", []() { return SharedValue::of(2); });
    cache.clear();
    EXPECT_EQ(cache.stats().entries, 0u);
    EXPECT_EQ(cache.state("a"), CacheEntryState::Absent);
    EXPECT_EQ(cache.state("b"), CacheEntryState::Absent);
}

TEST(CacheLayerTests, MaxEntries_EvictsLeastRecentlyUsed)
{
    CacheConfig config;
    config.max_entries = 2;
    CacheLayer cache{config};

    (void)cache.get_or_compute("a", []() { return SharedValue::of(1); });
    (void)cache.get_or_compute("b", []() { return SharedValue::of(2); });
    // Touch "a" so that "b" becomes the oldest entry.
    (void)cache.get_or_compute("a", []() { return SharedValue::of(-1); });
    (void)cache.get_or_compute("c", []() { return SharedValue::of(3); });

    EXPECT_EQ(cache.state("a"), CacheEntryState::Ready);
    EXPECT_EQ(cache.state("b"), CacheEntryState::Absent);
    EXPECT_EQ(cache.state("c"), CacheEntryState::Ready);

    auto stats = cache.stats();
    EXPECT_EQ(stats.evictions, 1u);
    EXPECT_EQ(stats.entries, 2u);
}

TEST(CacheLayerTests, Invalidate_WhileComputing_CallerStillGetsValue)
{
    CacheLayer cache;
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    SharedValue result;

    std::thread worker([&]() {
        result = cache.get_or_compute("k", [&]() {
            started = true;
            while (!release)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return SharedValue::of(5);
        });
    });
    while (!started)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_TRUE(cache.invalidate("k"));
    release = true;
    worker.join();

    EXPECT_EQ(result.as<int>(), 5);
    EXPECT_EQ(cache.state("k"), CacheEntryState::Absent);
}

// =============================================================================
// Fingerprints
// =============================================================================

TEST(CacheLayerTests, Fingerprint_IsDeterministic)
{
    auto a = cache_fingerprint("load_rules", {"ESS", "dir"});
    auto b = cache_fingerprint("load_rules", {"ESS", "dir"});
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.rfind("load_rules:", 0), 0u);
    EXPECT_EQ(a.size(), std::string("load_rules:").size() + 16);
}

TEST(CacheLayerTests, Fingerprint_DependsOnArgumentsAndBoundaries)
{
    EXPECT_NE(cache_fingerprint("f", {"a"}), cache_fingerprint("f", {"b"}));
    EXPECT_NE(cache_fingerprint("f", {"ab", "c"}), cache_fingerprint("f", {"a", "bc"}));
    EXPECT_NE(cache_fingerprint("f", {"x"}), cache_fingerprint("g", {"x"}));
}
