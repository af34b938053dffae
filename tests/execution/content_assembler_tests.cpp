#include <gtest/gtest.h>
#include "modpipe/execution/content_assembler.hpp"

using namespace modpipe;

namespace
{

ModuleRecord record(const std::string& id,
                    int priority,
                    ModuleStatus status,
                    std::string content = {},
                    size_t wave = 0,
                    size_t registration = 0)
{
    ModuleRecord r;
    r.id = id;
    r.priority = priority;
    r.status = status;
    r.content = std::move(content);
    r.wave_index = wave;
    r.registration_index = registration;
    return r;
}

} // namespace

// =============================================================================
// Ordering
// =============================================================================

TEST(ContentAssemblerTests, Assemble_OrdersByPriorityAscending)
{
    ContentAssembler assembler;
    std::vector<ModuleRecord> records{
        record("late", 30, ModuleStatus::Success, "C"),
        record("early", 10, ModuleStatus::Success, "A"),
        record("middle", 20, ModuleStatus::Success, "B")};

    EXPECT_EQ(assembler.assemble(records), "A\n\nB\n\nC");
}

TEST(ContentAssemblerTests, Assemble_TiesBrokenByWaveThenRegistration)
{
    ContentAssembler assembler;
    std::vector<ModuleRecord> records{
        record("w1", 5, ModuleStatus::Success, "wave1", 1, 0),
        record("r2", 5, ModuleStatus::Success, "reg2", 0, 2),
        record("r1", 5, ModuleStatus::Success, "reg1", 0, 1)};

    EXPECT_EQ(assembler.assemble(records), "reg1\n\nreg2\n\nwave1");
}

TEST(ContentAssemblerTests, Assemble_CustomSeparator)
{
    AssemblerConfig config;
    config.separator = "\n---\n";
    ContentAssembler assembler{config};
    std::vector<ModuleRecord> records{
        record("a", 1, ModuleStatus::Success, "one"),
        record("b", 2, ModuleStatus::Success, "two")};

    EXPECT_EQ(assembler.assemble(records), "one\n---\ntwo");
}

// =============================================================================
// Filtering
// =============================================================================

TEST(ContentAssemblerTests, Assemble_SkipsBlankAndUnsuccessful)
{
    ContentAssembler assembler;
    std::vector<ModuleRecord> records{
        record("ok", 1, ModuleStatus::Success, "kept"),
        record("blank", 2, ModuleStatus::Success, " \n\t"),
        record("failed", 3, ModuleStatus::Failure, "ignored"),
        record("timeout", 4, ModuleStatus::Timeout),
        record("skipped", 5, ModuleStatus::Skipped),
        record("cancelled", 6, ModuleStatus::Cancelled)};

    EXPECT_EQ(assembler.assemble(records), "kept");
}

TEST(ContentAssemblerTests, Assemble_NoRecords_IsEmpty)
{
    ContentAssembler assembler;
    EXPECT_EQ(assembler.assemble({}), "");
}

TEST(ContentAssemblerTests, Assemble_PlaceholdersForFailureAndTimeout)
{
    AssemblerConfig config;
    config.include_failure_placeholders = true;
    ContentAssembler assembler{config};
    std::vector<ModuleRecord> records{
        record("intro", 1, ModuleStatus::Success, "Intro"),
        record("rules", 2, ModuleStatus::Failure),
        record("slow", 3, ModuleStatus::Timeout),
        record("skipped", 4, ModuleStatus::Skipped)};

    EXPECT_EQ(assembler.assemble(records),
              "Intro\n\n[rules unavailable: Failure]\n\n[slow unavailable: Timeout]");
}

// =============================================================================
// Finalize
// =============================================================================

TEST(ContentAssemblerTests, Finalize_FillsArtifactAndLength)
{
    ContentAssembler assembler;
    RunMetadata metadata;
    metadata.status = RunStatus::PartialFailure;
    metadata.modules = {record("a", 1, ModuleStatus::Success, "abc"),
                        record("b", 2, ModuleStatus::Failure)};

    auto state = std::make_shared<StateMap>();
    auto result = assembler.finalize(metadata, state);

    EXPECT_EQ(result.status, RunStatus::PartialFailure);
    EXPECT_EQ(result.artifact, "abc");
    EXPECT_EQ(result.metadata.artifact_length, 3u);
    EXPECT_EQ(result.shared_state, state);
    EXPECT_EQ(result.metadata.count(ModuleStatus::Failure), 1u);
}

TEST(ContentAssemblerTests, Summary_ListsCounts)
{
    RunMetadata metadata;
    metadata.wave_count = 2;
    metadata.modules = {record("a", 1, ModuleStatus::Success, "x"),
                        record("b", 2, ModuleStatus::Timeout)};
    metadata.artifact_length = 1;

    EXPECT_EQ(metadata.summary(),
              "Run Complete (waves=2, succeeded=1, failed=0, timed_out=1, skipped=0, "
              "cancelled=0, artifact_length=1)");
}
