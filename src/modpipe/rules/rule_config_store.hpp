/**
 * @file rule_config_store.hpp
 * @brief Read-only rule records loaded from a directory of JSON files.
 */
#pragma once
#include "modpipe/common/common.hpp"
#include "modpipe/common/cache_layer.hpp"
#include <json/json.h>

namespace modpipe
{

/**
 * @brief One rule record.
 */
struct RuleRecord
{
    /// Identifier such as "ESS-01"; its prefix is the rule category.
    std::string id;
    std::string name;
    std::string explanation;
    std::string question;
    std::vector<std::string> good_examples;
    std::vector<std::string> bad_examples;
};

using RuleList = std::vector<RuleRecord>;

/**
 * @brief Loads rule records, one per `*.json` file of a directory.
 *
 * @details
 * Each file holds one object:
 * @code{.json}
 * { "id": "ESS-01", "name": "...", "explanation": "...", "question": "...",
 *   "good_examples": ["..."], "bad_examples": ["..."] }
 * @endcode
 * A missing `id` defaults to the file name without extension. Every other
 * field is optional.
 *
 * Reads go through the cache layer under the key `rules:<category>` with
 * process lifetime, so the directory is scanned at most once per category
 * however many modules or runs ask for it.
 *
 * @par Thread safety
 * - Immutable after construction apart from the load counter; safe to share.
 */
class RuleConfigStore
{
public:
    explicit RuleConfigStore(std::string rules_dir);

    /**
     * @brief Get the rules of a category, through the cache.
     * @return Records whose id starts with category, sorted by id.
     * @throws PipelineError with `ComputationFailed` if loading failed.
     */
    std::shared_ptr<const RuleList> rules_for(const std::string& category, CacheLayer& cache) const;

    /**
     * @brief Read the rules of a category from disk, bypassing the cache.
     * @throws PipelineError with `ConfigurationError` if the directory cannot
     *         be read or a file is malformed.
     */
    RuleList load_category(const std::string& category) const;

    /**
     * @brief Convert one parsed document into a record.
     * @param fallback_id Used when the document has no `id`.
     * @throws PipelineError with `ConfigurationError` if a field has the wrong type.
     */
    static RuleRecord parse_rule(const Json::Value& document,
                                 const std::string& fallback_id,
                                 const std::string& source);

    static std::string cache_key(const std::string& category)
    {
        return "rules:" + category;
    }

    const std::string& rules_dir() const noexcept
    {
        return m_rules_dir;
    }

    /**
     * @brief Number of directory scans performed so far.
     */
    size_t load_count() const noexcept
    {
        return m_load_count.load(std::memory_order_acquire);
    }

private:
    std::string m_rules_dir;
    mutable std::atomic<size_t> m_load_count{0};
};

} // namespace modpipe
