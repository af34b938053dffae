#include "modpipe/common/dependency_resolver.hpp"
#include "modpipe/common/logging.hpp"
#include "modpipe/common/pipeline_exceptions.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace modpipe
{

namespace
{

using NodeIdx = size_t;

/**
 * @brief Adjacency over the combined (explicit + implicit) edge set.
 */
struct ModuleGraph
{
    std::vector<ModuleDescriptorPtr> nodes;
    std::vector<std::vector<NodeIdx>> successors;
    std::vector<size_t> in_degree;
};

ModuleGraph build_graph(const std::vector<ModuleDescriptorPtr>& descriptors)
{
    ModuleGraph graph;
    graph.nodes = descriptors;
    const size_t n = descriptors.size();
    graph.successors.resize(n);
    graph.in_degree.assign(n, 0);

    std::unordered_map<ModuleId, NodeIdx> index_of;
    for (NodeIdx i = 0; i < n; ++i)
    {
        if (!index_of.emplace(descriptors[i]->id, i).second)
        {
            throw PipelineError(
                PipelineErrorCode::DuplicateModuleId,
                fmt::format("Module id '{}' appears more than once", descriptors[i]->id));
        }
    }

    std::unordered_map<StateKey, NodeIdx> producer_of;
    for (NodeIdx i = 0; i < n; ++i)
    {
        for (const auto& key : descriptors[i]->produced_keys)
        {
            producer_of.emplace(key, i);
        }
    }

    std::set<std::pair<NodeIdx, NodeIdx>> edges;

    // Explicit: dependency -> dependent
    for (NodeIdx i = 0; i < n; ++i)
    {
        for (const auto& dep : descriptors[i]->dependencies)
        {
            auto it = index_of.find(dep);
            if (it != index_of.end())
            {
                edges.emplace(it->second, i);
            }
        }
    }

    // Implicit: producer -> consumer
    for (NodeIdx i = 0; i < n; ++i)
    {
        for (const auto& key : descriptors[i]->consumed_keys)
        {
            auto it = producer_of.find(key);
            if (it != producer_of.end() && it->second != i)
            {
                edges.emplace(it->second, i);
            }
        }
    }

    for (const auto& [before, after] : edges)
    {
        graph.successors[before].push_back(after);
        ++graph.in_degree[after];
    }
    return graph;
}

/**
 * @brief Check whether node can reach itself through unprocessed nodes.
 */
bool lies_on_cycle(const ModuleGraph& graph, const std::vector<bool>& remaining, NodeIdx start)
{
    std::vector<bool> visited(graph.nodes.size(), false);
    std::vector<NodeIdx> stack{start};
    while (!stack.empty())
    {
        NodeIdx s = stack.back();
        stack.pop_back();
        for (NodeIdx succ : graph.successors[s])
        {
            if (succ == start)
            {
                return true;
            }
            if (remaining[succ] && !visited[succ])
            {
                visited[succ] = true;
                stack.push_back(succ);
            }
        }
    }
    return false;
}

/**
 * @brief Kahn's algorithm, one wave per round.
 * @return A Cycle diagnostic if some nodes never became ready.
 */
std::optional<DiagnosticItem> sort_into_waves(const ModuleGraph& graph, WavePlan& plan)
{
    const size_t n = graph.nodes.size();
    std::vector<size_t> in_degree = graph.in_degree;

    auto dispatch_order = [&graph](NodeIdx a, NodeIdx b) {
        const auto& da = *graph.nodes[a];
        const auto& db = *graph.nodes[b];
        if (da.priority != db.priority)
        {
            return da.priority > db.priority;
        }
        return da.id < db.id;
    };

    std::vector<NodeIdx> ready;
    for (NodeIdx s = 0; s < n; ++s)
    {
        if (in_degree[s] == 0)
        {
            ready.push_back(s);
        }
    }

    std::vector<bool> remaining(n, true);
    size_t processed = 0;
    while (!ready.empty())
    {
        std::sort(ready.begin(), ready.end(), dispatch_order);

        std::vector<ModuleId> wave;
        std::vector<NodeIdx> next;
        for (NodeIdx s : ready)
        {
            wave.push_back(graph.nodes[s]->id);
            remaining[s] = false;
            ++processed;
        }
        for (NodeIdx s : ready)
        {
            for (NodeIdx succ : graph.successors[s])
            {
                --in_degree[succ];
                if (in_degree[succ] == 0)
                {
                    next.push_back(succ);
                }
            }
        }
        plan.waves.push_back(std::move(wave));
        ready = std::move(next);
    }

    if (processed == n)
    {
        return std::nullopt;
    }

    DiagnosticItem item;
    item.severity = DiagnosticSeverity::Error;
    item.category = DiagnosticCategory::Cycle;

    // Leftover nodes are either on a cycle or downstream of one.
    for (NodeIdx s = 0; s < n; ++s)
    {
        if (!remaining[s])
        {
            continue;
        }
        if (lies_on_cycle(graph, remaining, s))
        {
            item.involved_modules.push_back(graph.nodes[s]->id);
        }
        else
        {
            item.blocked_modules.push_back(graph.nodes[s]->id);
        }
    }
    std::sort(item.involved_modules.begin(), item.involved_modules.end());
    std::sort(item.blocked_modules.begin(), item.blocked_modules.end());

    item.message = fmt::format("Cyclic dependency among modules: {}",
                               fmt::join(item.involved_modules, ", "));
    if (!item.blocked_modules.empty())
    {
        item.message += fmt::format(" (blocked: {})", fmt::join(item.blocked_modules, ", "));
    }
    return item;
}

} // namespace

WavePlan DependencyResolver::resolve(const std::vector<ModuleDescriptorPtr>& descriptors)
{
    ModuleGraph graph = build_graph(descriptors);
    WavePlan plan;
    auto cycle = sort_into_waves(graph, plan);
    if (cycle)
    {
        auto diagnostics = std::make_shared<PipelineDiagnostics>();
        std::string message = cycle->message;
        diagnostics->add(std::move(*cycle));
        LOG_F(ERROR, "{}", message);
        throw RegistrationError(PipelineErrorCode::CyclicDependency, message, std::move(diagnostics));
    }
    LOG_F(1, "Resolved {} module(s) into {} wave(s)", plan.module_count(), plan.wave_count());
    return plan;
}

bool DependencyResolver::check_acyclic(const std::vector<ModuleDescriptorPtr>& descriptors,
                                       PipelineDiagnostics& diagnostics)
{
    ModuleGraph graph = build_graph(descriptors);
    WavePlan plan;
    auto cycle = sort_into_waves(graph, plan);
    if (cycle)
    {
        diagnostics.add(std::move(*cycle));
        return false;
    }
    return true;
}

} // namespace modpipe
