#include "modpipe/modules/text_module.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include "modpipe/common/shared_state.hpp"
#include <fmt/format.h>

namespace modpipe
{

TextModule::TextModule(std::string text_template,
                       std::vector<StateKey> required_keys,
                       std::map<StateKey, std::string> writes)
    : m_template{std::move(text_template)}
    , m_required_keys{std::move(required_keys)}
    , m_writes{std::move(writes)}
{}

ModuleFactory TextModule::build(const ModuleConfig& config)
{
    const Json::Value& options = config.options;
    auto fail = [&config](const std::string& what) {
        return PipelineError(PipelineErrorCode::ConfigurationError,
                             fmt::format("Module '{}' (text): {}", config.id, what));
    };

    if (!options.isMember("text") || !options["text"].isString())
    {
        throw fail("option 'text' must be a string");
    }
    std::string text_template = options["text"].asString();

    std::vector<StateKey> required_keys;
    if (options.isMember("requires"))
    {
        if (!options["requires"].isArray())
        {
            throw fail("option 'requires' must be an array");
        }
        for (const auto& key : options["requires"])
        {
            if (!key.isString() || config.consumes.count(key.asString()) == 0)
            {
                throw fail("option 'requires' may only name consumed keys");
            }
            required_keys.push_back(key.asString());
        }
    }

    std::map<StateKey, std::string> writes;
    if (options.isMember("writes"))
    {
        if (!options["writes"].isObject())
        {
            throw fail("option 'writes' must be an object");
        }
        for (const auto& key : options["writes"].getMemberNames())
        {
            const Json::Value& value = options["writes"][key];
            if (!value.isString())
            {
                throw fail(fmt::format("write '{}' must be a string", key));
            }
            if (config.produces.count(key) == 0)
            {
                throw fail(fmt::format("write '{}' is not a produced key", key));
            }
            writes.emplace(key, value.asString());
        }
    }

    return [text_template, required_keys, writes](const ModuleDescriptor&) -> ContentModulePtr {
        return std::make_shared<TextModule>(text_template, required_keys, writes);
    };
}

std::optional<std::string> TextModule::validate_input(const ModuleContext& context) const
{
    for (const auto& key : m_required_keys)
    {
        if (!context.has(key))
        {
            return fmt::format("required key '{}' is missing", key);
        }
    }
    return std::nullopt;
}

ModuleOutput TextModule::execute(const ModuleContext& context) const
{
    ModuleOutput output = ModuleOutput::with_content(render(m_template, context));
    for (const auto& kv : m_writes)
    {
        output.writes.emplace(kv.first, SharedValue::of(render(kv.second, context)));
    }
    return output;
}

const std::string& TextModule::class_name() const
{
    static const std::string name = "TextModule";
    return name;
}

std::string TextModule::render(const std::string& text_template, const ModuleContext& context)
{
    std::string result;
    result.reserve(text_template.size());

    size_t pos = 0;
    while (pos < text_template.size())
    {
        size_t open = text_template.find('{', pos);
        if (open == std::string::npos)
        {
            break;
        }
        size_t close = text_template.find('}', open + 1);
        if (close == std::string::npos)
        {
            break;
        }
        result.append(text_template, pos, open - pos);

        std::string key = text_template.substr(open + 1, close - open - 1);
        if (context.descriptor().consumes(key))
        {
            if (auto value = context.get_as<std::string>(key))
            {
                result += *value;
            }
        }
        else
        {
            result.append(text_template, open, close - open + 1);
        }
        pos = close + 1;
    }
    result.append(text_template, pos, std::string::npos);
    return result;
}

} // namespace modpipe
