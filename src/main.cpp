#include "modpipe/common/logging.hpp"
#include "modpipe/config/module_catalog.hpp"
#include "modpipe/config/pipeline_config.hpp"
#include "modpipe/execution/orchestrator.hpp"
#include "modpipe/modules/rules_section_module.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace
{

constexpr int kExitIncompleteRun = 2;

void print_usage(const char* program)
{
    std::cerr << "Usage: " << program << " <config.json> [key=value ...]\n"
              << "  Runs every configured module and prints the assembled artifact.\n"
              << "  Each key=value pair becomes a string entry of the initial context.\n"
              << "  Pass -v <level> to raise log verbosity.\n";
}

modpipe::StateMap parse_initial_context(int argc, char** argv, int first)
{
    modpipe::StateMap context;
    for (int i = first; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            throw std::invalid_argument("Expected key=value, got '" + arg + "'");
        }
        context[arg.substr(0, eq)] = modpipe::SharedValue::of(arg.substr(eq + 1));
    }
    return context;
}

} // namespace

int main(int argc, char** argv)
{
    loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;
    loguru::init(argc, argv);

    if (argc < 2)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        auto config = modpipe::PipelineConfig::load(argv[1]);
        auto initial_context = parse_initial_context(argc, argv, 2);

        auto cache = std::make_shared<modpipe::CacheLayer>(config.cache);
        auto rules = std::make_shared<modpipe::RuleConfigStore>(config.rules_dir);
        auto registry = std::make_shared<modpipe::ModuleRegistry>();

        modpipe::ModuleCatalog catalog;
        modpipe::register_builtin_kinds(catalog, rules);
        catalog.register_all(config, *registry);

        modpipe::Orchestrator orchestrator{
            registry, cache, modpipe::make_executor(config.executor), config.orchestrator};
        auto result = orchestrator.run_pipeline({}, std::move(initial_context));

        std::cout << result.artifact << "\n" << std::flush;
        std::cerr << result.metadata.summary() << "\n";
        for (const auto& record : result.metadata.modules)
        {
            if (record.status != modpipe::ModuleStatus::Success)
            {
                std::cerr << "  " << record.id << ": " << modpipe::to_string(record.status);
                if (!record.error_message.empty())
                {
                    std::cerr << " (" << record.error_message << ")";
                }
                std::cerr << "\n";
            }
        }
        if (result.status == modpipe::RunStatus::Rejected)
        {
            std::cerr << "Rejected: " << result.metadata.rejection_reason << "\n";
        }
        return result.status == modpipe::RunStatus::Complete ? EXIT_SUCCESS : kExitIncompleteRun;
    }
    catch (const std::exception& e)
    {
        LOG_F(ERROR, "{}", e.what());
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
}
