/**
 * @file pipeline_config.hpp
 * @brief Static pipeline configuration loaded from JSON.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/cache_layer.hpp"
#include "modpipe/common/module_descriptor.hpp"
#include "modpipe/execution/executor.hpp"
#include "modpipe/execution/orchestrator.hpp"
#include <json/json.h>

namespace modpipe
{

/**
 * @brief Configuration of one module entry.
 */
struct ModuleConfig
{
    ModuleId id;
    std::string name;

    /// Catalog kind used to build the module, e.g. "text" or "rules".
    std::string kind;

    int priority{0};
    std::set<ModuleId> dependencies;
    std::set<StateKey> produces;
    std::set<StateKey> consumes;
    bool required{false};
    std::chrono::milliseconds timeout{0};

    /// Kind-specific options; always an object (possibly empty).
    Json::Value options{Json::objectValue};

    ModuleDescriptor to_descriptor() const;
};

/**
 * @brief Whole-pipeline configuration.
 *
 * @details
 * Expected document layout:
 * @code{.json}
 * {
 *   "worker_count": 4,
 *   "run_timeout_ms": 0,
 *   "module_timeout_ms": 0,
 *   "cache": { "max_entries": 1000 },
 *   "assembler": { "include_failure_placeholders": false },
 *   "rules_dir": "rules",
 *   "modules": [
 *     { "id": "intro", "kind": "text", "priority": 10,
 *       "dependencies": [], "produces": [], "consumes": ["term"],
 *       "required": true, "timeout_ms": 0, "options": { "text": "..." } }
 *   ]
 * }
 * @endcode
 * Every field except `modules` is optional. Zero timeouts mean no timeout.
 * A relative `rules_dir` is resolved against the directory of the
 * configuration file when loaded with `load()`.
 */
struct PipelineConfig
{
    ExecutorConfig executor{};
    OrchestratorConfig orchestrator{};
    CacheConfig cache{};
    std::string rules_dir{"rules"};
    std::vector<ModuleConfig> modules;

    /**
     * @brief Build a configuration from a parsed document.
     * @param base_dir Directory used to resolve a relative rules_dir; empty
     *        leaves it unchanged.
     * @throws PipelineError with `ConfigurationError` on any invalid field.
     */
    static PipelineConfig from_json(const Json::Value& root, const std::string& base_dir = {});

    /**
     * @brief Parse a configuration from JSON text.
     * @throws PipelineError with `ConfigurationError` on malformed JSON or
     *         invalid fields.
     */
    static PipelineConfig parse(const std::string& text);

    /**
     * @brief Load a configuration file.
     * @throws PipelineError with `ConfigurationError` if the file cannot be
     *         read or is invalid.
     */
    static PipelineConfig load(const std::string& path);
};

/**
 * @brief Parse JSON text into a document.
 * @param source Name used in error messages.
 * @throws PipelineError with `ConfigurationError` on malformed JSON.
 */
Json::Value parse_json_document(const std::string& text, const std::string& source);

} // namespace modpipe
