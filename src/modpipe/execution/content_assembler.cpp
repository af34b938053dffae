#include "modpipe/execution/content_assembler.hpp"
#include <fmt/format.h>

namespace modpipe
{

namespace
{

bool is_blank(const std::string& text)
{
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

ContentAssembler::ContentAssembler(AssemblerConfig config)
    : m_config{std::move(config)}
{}

std::string ContentAssembler::assemble(const std::vector<ModuleRecord>& records) const
{
    std::vector<const ModuleRecord*> ordered;
    ordered.reserve(records.size());
    for (const auto& record : records)
    {
        ordered.push_back(&record);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ModuleRecord* a, const ModuleRecord* b) {
                         if (a->priority != b->priority)
                         {
                             return a->priority < b->priority;
                         }
                         if (a->wave_index != b->wave_index)
                         {
                             return a->wave_index < b->wave_index;
                         }
                         return a->registration_index < b->registration_index;
                     });

    std::string artifact;
    bool first = true;
    auto append = [&](const std::string& fragment) {
        if (!first)
        {
            artifact += m_config.separator;
        }
        artifact += fragment;
        first = false;
    };

    for (const ModuleRecord* record : ordered)
    {
        switch (record->status)
        {
        case ModuleStatus::Success:
            if (!is_blank(record->content))
            {
                append(record->content);
            }
            break;
        case ModuleStatus::Failure:
        case ModuleStatus::Timeout:
            if (m_config.include_failure_placeholders)
            {
                append(failure_placeholder(*record));
            }
            break;
        case ModuleStatus::Skipped:
        case ModuleStatus::Cancelled:
            break;
        }
    }
    return artifact;
}

PipelineRunResult ContentAssembler::finalize(RunMetadata metadata, StateSnapshot shared_state) const
{
    PipelineRunResult result;
    result.artifact = assemble(metadata.modules);
    metadata.artifact_length = result.artifact.size();
    result.status = metadata.status;
    result.metadata = std::move(metadata);
    result.shared_state = std::move(shared_state);
    return result;
}

std::string ContentAssembler::failure_placeholder(const ModuleRecord& record)
{
    return fmt::format("[{} unavailable: {}]", record.id, to_string(record.status));
}

} // namespace modpipe
