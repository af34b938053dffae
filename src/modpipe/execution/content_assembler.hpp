/**
 * @file content_assembler.hpp
 * @brief Merges module outputs into the final artifact.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/execution/run_result.hpp"

namespace modpipe
{

/**
 * @brief Configuration for ContentAssembler.
 */
struct AssemblerConfig
{
    /**
     * @brief Emit a placeholder line for failed and timed-out modules.
     */
    bool include_failure_placeholders{false};

    /**
     * @brief Text placed between fragments.
     */
    std::string separator{"\n\n"};
};

/**
 * @brief Builds the artifact and run result from module records.
 *
 * @details
 * Fragments are ordered by ascending priority, then wave index, then
 * registration order, and joined with the separator. Only `Success` records
 * with non-blank content contribute. The order does not depend on completion
 * order, so identical inputs give byte-identical artifacts.
 *
 * @par Thread safety
 * - Stateless apart from its configuration; safe to share.
 */
class ContentAssembler
{
public:
    explicit ContentAssembler(AssemblerConfig config = {});

    /**
     * @brief Join the contributing fragments of records.
     */
    std::string assemble(const std::vector<ModuleRecord>& records) const;

    /**
     * @brief Build the run result: artifact, artifact length and snapshot.
     */
    PipelineRunResult finalize(RunMetadata metadata, StateSnapshot shared_state) const;

    /**
     * @brief Placeholder emitted for a failed or timed-out module.
     */
    static std::string failure_placeholder(const ModuleRecord& record);

    const AssemblerConfig& config() const noexcept
    {
        return m_config;
    }

private:
    AssemblerConfig m_config;
};

} // namespace modpipe
