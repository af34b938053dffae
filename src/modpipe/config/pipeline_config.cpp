#include "modpipe/config/pipeline_config.hpp"
#include "modpipe/common/logging.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace modpipe
{

namespace
{

[[noreturn]] void fail(const std::string& where, const std::string& what)
{
    throw PipelineError(PipelineErrorCode::ConfigurationError,
                        fmt::format("Invalid configuration at {}: {}", where, what));
}

const Json::Value* find_member(const Json::Value& object, const char* field)
{
    return object.isMember(field) ? &object[field] : nullptr;
}

int64_t read_int(const Json::Value& object, const char* field, int64_t fallback,
                 const std::string& where, int64_t min_value = 0)
{
    const Json::Value* value = find_member(object, field);
    if (!value || value->isNull())
    {
        return fallback;
    }
    if (!value->isIntegral())
    {
        fail(where + "." + field, "expected an integer");
    }
    if (!value->isInt64())
    {
        fail(where + "." + field, "integer out of range");
    }
    int64_t result = value->asInt64();
    if (result < min_value)
    {
        fail(where + "." + field, fmt::format("must be at least {}", min_value));
    }
    return result;
}

bool read_bool(const Json::Value& object, const char* field, bool fallback, const std::string& where)
{
    const Json::Value* value = find_member(object, field);
    if (!value || value->isNull())
    {
        return fallback;
    }
    if (!value->isBool())
    {
        fail(where + "." + field, "expected a boolean");
    }
    return value->asBool();
}

std::string read_string(const Json::Value& object, const char* field, const std::string& fallback,
                        const std::string& where)
{
    const Json::Value* value = find_member(object, field);
    if (!value || value->isNull())
    {
        return fallback;
    }
    if (!value->isString())
    {
        fail(where + "." + field, "expected a string");
    }
    return value->asString();
}

std::set<std::string> read_string_set(const Json::Value& object, const char* field,
                                      const std::string& where)
{
    std::set<std::string> result;
    const Json::Value* value = find_member(object, field);
    if (!value || value->isNull())
    {
        return result;
    }
    if (!value->isArray())
    {
        fail(where + "." + field, "expected an array of strings");
    }
    for (Json::ArrayIndex i = 0; i < value->size(); ++i)
    {
        const Json::Value& item = (*value)[i];
        if (!item.isString() || item.asString().empty())
        {
            fail(fmt::format("{}.{}[{}]", where, field, i), "expected a non-empty string");
        }
        result.insert(item.asString());
    }
    return result;
}

ModuleConfig read_module(const Json::Value& entry, const std::string& where)
{
    if (!entry.isObject())
    {
        fail(where, "expected an object");
    }

    ModuleConfig module;
    module.id = read_string(entry, "id", "", where);
    if (module.id.empty())
    {
        fail(where + ".id", "is required");
    }
    std::string at = fmt::format("module '{}'", module.id);
    module.kind = read_string(entry, "kind", "", at);
    if (module.kind.empty())
    {
        fail(at + ".kind", "is required");
    }
    module.name = read_string(entry, "name", "", at);
    module.priority = static_cast<int>(
        read_int(entry, "priority", 0, at, std::numeric_limits<int>::min()));
    module.dependencies = read_string_set(entry, "dependencies", at);
    module.produces = read_string_set(entry, "produces", at);
    module.consumes = read_string_set(entry, "consumes", at);
    module.required = read_bool(entry, "required", false, at);
    module.timeout = std::chrono::milliseconds{read_int(entry, "timeout_ms", 0, at)};

    const Json::Value* options = find_member(entry, "options");
    if (options && !options->isNull())
    {
        if (!options->isObject())
        {
            fail(at + ".options", "expected an object");
        }
        module.options = *options;
    }
    return module;
}

} // namespace

ModuleDescriptor ModuleConfig::to_descriptor() const
{
    ModuleDescriptor descriptor;
    descriptor.id = id;
    descriptor.name = name;
    descriptor.priority = priority;
    descriptor.dependencies = dependencies;
    descriptor.produced_keys = produces;
    descriptor.consumed_keys = consumes;
    descriptor.required = required;
    descriptor.timeout = timeout;
    return descriptor;
}

PipelineConfig PipelineConfig::from_json(const Json::Value& root, const std::string& base_dir)
{
    if (!root.isObject())
    {
        fail("root", "expected an object");
    }

    PipelineConfig config;
    config.executor.worker_count = static_cast<size_t>(read_int(root, "worker_count", 4, "root"));
    config.orchestrator.run_timeout = std::chrono::milliseconds{read_int(root, "run_timeout_ms", 0, "root")};
    config.orchestrator.module_timeout =
        std::chrono::milliseconds{read_int(root, "module_timeout_ms", 0, "root")};

    if (const Json::Value* cache = find_member(root, "cache"))
    {
        if (!cache->isObject())
        {
            fail("cache", "expected an object");
        }
        config.cache.max_entries = static_cast<size_t>(read_int(*cache, "max_entries", 0, "cache"));
    }

    if (const Json::Value* assembler = find_member(root, "assembler"))
    {
        if (!assembler->isObject())
        {
            fail("assembler", "expected an object");
        }
        config.orchestrator.assembler.include_failure_placeholders =
            read_bool(*assembler, "include_failure_placeholders", false, "assembler");
    }

    config.rules_dir = read_string(root, "rules_dir", config.rules_dir, "root");
    if (!base_dir.empty() && std::filesystem::path(config.rules_dir).is_relative())
    {
        config.rules_dir = (std::filesystem::path(base_dir) / config.rules_dir).string();
    }

    const Json::Value* modules = find_member(root, "modules");
    if (!modules || !modules->isArray())
    {
        fail("root.modules", "expected an array");
    }
    std::set<ModuleId> seen;
    for (Json::ArrayIndex i = 0; i < modules->size(); ++i)
    {
        ModuleConfig module = read_module((*modules)[i], fmt::format("modules[{}]", i));
        if (!seen.insert(module.id).second)
        {
            fail(fmt::format("modules[{}]", i), fmt::format("duplicate module id '{}'", module.id));
        }
        config.modules.push_back(std::move(module));
    }

    LOG_F(1, "Configuration has {} module(s), {} worker(s)",
          config.modules.size(), config.executor.worker_count);
    return config;
}

Json::Value parse_json_document(const std::string& text, const std::string& source)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Malformed JSON in {}: {}", source, errors));
    }
    return root;
}

PipelineConfig PipelineConfig::parse(const std::string& text)
{
    return from_json(parse_json_document(text, "configuration"));
}

PipelineConfig PipelineConfig::load(const std::string& path)
{
    std::ifstream in{path};
    if (!in)
    {
        throw PipelineError(PipelineErrorCode::ConfigurationError,
                            fmt::format("Cannot open configuration file '{}'", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    LOG_F(INFO, "Loading configuration from '{}'", path);
    auto base_dir = std::filesystem::path(path).parent_path().string();
    return from_json(parse_json_document(buffer.str(), path), base_dir);
}

} // namespace modpipe
