#include "modpipe/rules/rule_config_store.hpp"
#include "modpipe/common/logging.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include "modpipe/config/pipeline_config.hpp"
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace modpipe
{

namespace
{

std::string read_text_field(const Json::Value& document, const char* field, const std::string& source)
{
    if (!document.isMember(field) || document[field].isNull())
    {
        return {};
    }
    if (!document[field].isString())
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Rule file '{}': field '{}' must be a string", source, field));
    }
    return document[field].asString();
}

std::vector<std::string> read_text_list(const Json::Value& document, const char* field,
                                        const std::string& source)
{
    std::vector<std::string> result;
    if (!document.isMember(field) || document[field].isNull())
    {
        return result;
    }
    const Json::Value& list = document[field];
    if (!list.isArray())
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Rule file '{}': field '{}' must be an array", source, field));
    }
    for (const auto& item : list)
    {
        if (!item.isString())
        {
            throw PipelineError(
                PipelineErrorCode::ConfigurationError,
                fmt::format("Rule file '{}': field '{}' must only hold strings", source, field));
        }
        result.push_back(item.asString());
    }
    return result;
}

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in{path};
    if (!in)
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Cannot open rule file '{}'", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

RuleConfigStore::RuleConfigStore(std::string rules_dir)
    : m_rules_dir{std::move(rules_dir)}
{}

std::shared_ptr<const RuleList> RuleConfigStore::rules_for(const std::string& category,
                                                          CacheLayer& cache) const
{
    return cache.get_or_compute_as<RuleList>(
        cache_key(category),
        [this, &category]() { return load_category(category); },
        kProcessLifetime);
}

RuleList RuleConfigStore::load_category(const std::string& category) const
{
    namespace fs = std::filesystem;

    m_load_count.fetch_add(1, std::memory_order_acq_rel);

    std::error_code ec;
    if (!fs::is_directory(m_rules_dir, ec))
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Rules directory '{}' does not exist", m_rules_dir));
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it{m_rules_dir, ec}, end; !ec && it != end; it.increment(ec))
    {
        if (it->is_regular_file() && it->path().extension() == ".json")
        {
            files.push_back(it->path());
        }
    }
    if (ec)
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Cannot list rules directory '{}': {}", m_rules_dir, ec.message()));
    }
    std::sort(files.begin(), files.end());

    RuleList rules;
    for (const auto& path : files)
    {
        std::string source = path.string();
        Json::Value document = parse_json_document(read_file(path), source);
        RuleRecord rule = parse_rule(document, path.stem().string(), source);
        if (rule.id.compare(0, category.size(), category) == 0)
        {
            rules.push_back(std::move(rule));
        }
    }
    std::sort(rules.begin(), rules.end(),
              [](const RuleRecord& a, const RuleRecord& b) { return a.id < b.id; });

    LOG_F(1, "Loaded {} rule(s) for category '{}' from '{}'", rules.size(), category, m_rules_dir);
    return rules;
}

RuleRecord RuleConfigStore::parse_rule(const Json::Value& document,
                                       const std::string& fallback_id,
                                       const std::string& source)
{
    if (!document.isObject())
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Rule file '{}' must hold an object", source));
    }
    RuleRecord rule;
    rule.id = read_text_field(document, "id", source);
    if (rule.id.empty())
    {
        rule.id = fallback_id;
    }
    rule.name = read_text_field(document, "name", source);
    rule.explanation = read_text_field(document, "explanation", source);
    rule.question = read_text_field(document, "question", source);
    rule.good_examples = read_text_list(document, "good_examples", source);
    rule.bad_examples = read_text_list(document, "bad_examples", source);
    return rule;
}

} // namespace modpipe
