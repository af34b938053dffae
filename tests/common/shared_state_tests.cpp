#include <gtest/gtest.h>
#include "modpipe/common/pipeline_exceptions.hpp"
#include "modpipe/common/shared_state.hpp"

using namespace modpipe;

namespace
{

ModuleDescriptor make_writer(const std::string& id, std::set<StateKey> produces)
{
    ModuleDescriptor d;
    d.id = id;
    d.produced_keys = std::move(produces);
    return d;
}

} // namespace

// =============================================================================
// SharedStateStore Tests
// =============================================================================

TEST(SharedStateStoreTests, InitialContext_IsPublished)
{
    SharedStateStore store{StateMap{{"topic", SharedValue::of(std::string("essays"))}}};
    EXPECT_TRUE(store.contains("topic"));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get("topic")->as<std::string>(), "essays");
    EXPECT_FALSE(store.get("missing").has_value());
}

TEST(SharedStateStoreTests, Stage_IsNotVisibleUntilCommit)
{
    SharedStateStore store;
    auto writer = make_writer("A", {"k"});
    store.stage(writer, StateMap{{"k", SharedValue::of(1)}});

    EXPECT_FALSE(store.contains("k"));
    EXPECT_EQ(store.commit(), 1u);
    EXPECT_TRUE(store.contains("k"));
    EXPECT_EQ(store.get("k")->as<int>(), 1);
}

TEST(SharedStateStoreTests, Snapshot_IsUnaffectedByLaterCommits)
{
    SharedStateStore store;
    auto before = store.snapshot();
    store.stage(make_writer("A", {"k"}), StateMap{{"k", SharedValue::of(1)}});
    store.commit();

    EXPECT_EQ(before->size(), 0u);
    EXPECT_EQ(store.snapshot()->size(), 1u);
}

TEST(SharedStateStoreTests, Commit_WithNothingStaged_KeepsSnapshot)
{
    SharedStateStore store;
    auto before = store.snapshot();
    EXPECT_EQ(store.commit(), 0u);
    EXPECT_EQ(before, store.snapshot());
}

TEST(SharedStateStoreTests, Stage_UndeclaredKey_RejectsWholeWriteSet)
{
    SharedStateStore store;
    auto writer = make_writer("A", {"declared"});
    StateMap writes{{"declared", SharedValue::of(1)}, {"other", SharedValue::of(2)}};

    try
    {
        store.stage(writer, writes);
        FAIL() << "Expected PipelineError";
    }
    catch (const PipelineError& e)
    {
        EXPECT_EQ(e.code(), PipelineErrorCode::UndeclaredStateAccess);
    }
    EXPECT_EQ(store.commit(), 0u);
    EXPECT_FALSE(store.contains("declared"));
}

TEST(SharedStateStoreTests, Stage_KeyAlreadyPublished_Throws)
{
    SharedStateStore store{StateMap{{"k", SharedValue::of(0)}}};
    try
    {
        store.stage(make_writer("A", {"k"}), StateMap{{"k", SharedValue::of(1)}});
        FAIL() << "Expected PipelineError";
    }
    catch (const PipelineError& e)
    {
        EXPECT_EQ(e.code(), PipelineErrorCode::DuplicateKeyProducer);
    }
    EXPECT_EQ(store.get("k")->as<int>(), 0);
}

// =============================================================================
// ModuleContext Tests
// =============================================================================

TEST(ModuleContextTests, Get_DeclaredKey_ReturnsValue)
{
    auto descriptor = std::make_shared<ModuleDescriptor>();
    descriptor->id = "reader";
    descriptor->consumed_keys = {"k"};
    auto snapshot = std::make_shared<StateMap>(StateMap{{"k", SharedValue::of(std::string("v"))}});

    ModuleContext context{descriptor, snapshot, nullptr, nullptr};
    EXPECT_TRUE(context.has("k"));
    auto value = context.get_as<std::string>("k");
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, "v");
    EXPECT_EQ(context.get_as<int>("k"), nullptr);
}

TEST(ModuleContextTests, Get_DeclaredButAbsentKey_ReturnsNothing)
{
    auto descriptor = std::make_shared<ModuleDescriptor>();
    descriptor->id = "reader";
    descriptor->consumed_keys = {"k"};

    ModuleContext context{descriptor, nullptr, nullptr, nullptr};
    EXPECT_FALSE(context.has("k"));
    EXPECT_EQ(context.get_as<std::string>("k"), nullptr);
}

TEST(ModuleContextTests, Get_UndeclaredKey_Throws)
{
    auto descriptor = std::make_shared<ModuleDescriptor>();
    descriptor->id = "reader";
    auto snapshot = std::make_shared<StateMap>(StateMap{{"k", SharedValue::of(1)}});

    ModuleContext context{descriptor, snapshot, nullptr, nullptr};
    try
    {
        (void)context.get("k");
        FAIL() << "Expected PipelineError";
    }
    catch (const PipelineError& e)
    {
        EXPECT_EQ(e.code(), PipelineErrorCode::UndeclaredStateAccess);
    }
}

TEST(ModuleContextTests, Cache_WithoutCacheLayer_Throws)
{
    auto descriptor = std::make_shared<ModuleDescriptor>();
    descriptor->id = "m";
    ModuleContext context{descriptor, nullptr, nullptr, nullptr};
    EXPECT_THROW((void)context.cache(), PipelineError);
}

TEST(ModuleContextTests, StopRequested_FollowsFlag)
{
    auto descriptor = std::make_shared<ModuleDescriptor>();
    descriptor->id = "m";
    auto flag = std::make_shared<std::atomic<bool>>(false);
    ModuleContext context{descriptor, nullptr, std::make_shared<CacheLayer>(), flag};

    EXPECT_FALSE(context.stop_requested());
    flag->store(true);
    EXPECT_TRUE(context.stop_requested());
}
