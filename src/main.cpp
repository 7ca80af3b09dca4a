#include "phasegraph/common/errors.hpp"
#include "phasegraph/common/logging.hpp"
#include "phasegraph/config/command_line_configuration.hpp"
#include "phasegraph/execution/interrupt_watcher.hpp"
#include "phasegraph/execution/parallel_executor.hpp"
#include "phasegraph/execution/shell_operation_runner.hpp"
#include "phasegraph/graph/operation_graph_builder.hpp"
#include <cstdlib>
#include <stdexcept>

using namespace phasegraph;

namespace
{

constexpr int config_error_exit_code = 2;

struct DemoOptions
{
    std::string command_name{"build"};
    size_t parallelism{0};
    bool verbose{false};
    bool production{false};
};

DemoOptions parse_arguments(int argc, char** argv)
{
    DemoOptions options;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--production")
        {
            options.production = true;
        }
        else if (arg == "--parallelism")
        {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("--parallelism requires a value");
            }
            options.parallelism = static_cast<size_t>(std::stoul(argv[++i]));
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw std::invalid_argument("Unknown option: " + arg);
        }
        else
        {
            options.command_name = arg;
        }
    }
    return options;
}

/// Two phases, a phased "test" command and a "--production" flag.
CommandLineJson demo_command_line()
{
    CommandLineJson json;

    PhaseJson compile;
    compile.name = "_phase:compile";
    compile.upstream_dependencies = {"_phase:compile"};
    json.phases.push_back(compile);

    PhaseJson test;
    test.name = "_phase:test";
    test.self_dependencies = {"_phase:compile"};
    test.ignore_missing_script = true;
    json.phases.push_back(test);

    CommandJson test_command;
    test_command.command_kind = CommandKind::Phased;
    test_command.name = "test";
    test_command.summary = "Compile and test every project";
    test_command.enable_parallelism = true;
    test_command.phases = {"_phase:compile", "_phase:test"};
    json.commands.push_back(test_command);

    CommandJson build_command;
    build_command.command_kind = CommandKind::Bulk;
    build_command.name = "build";
    build_command.enable_parallelism = true;
    json.commands.push_back(build_command);

    ParameterJson production;
    production.parameter_kind = ParameterKind::Flag;
    production.long_name = "--production";
    production.description = "Build for production";
    production.associated_commands = {"build", "test"};
    production.associated_phases = {"_phase:compile"};
    json.parameters.push_back(production);

    return CommandLineConfiguration::merge_default_build_commands(std::move(json));
}

ProjectGraph demo_projects()
{
    ProjectGraph projects;
    ProjectIdx lib = projects.add_project(
        "lib", "",
        {{"build", "echo building lib"},
         {"_phase:compile", "echo compiling lib"},
         {"_phase:test", "echo testing lib"}});
    ProjectIdx app = projects.add_project(
        "app", "",
        {{"build", "echo building app"},
         {"_phase:compile", "echo compiling app"}});
    projects.add_dependency(app, lib);
    return projects;
}

} // namespace

int main(int argc, char** argv)
{
    auto logger = make_console_logger("phasegraph");
    try
    {
        DemoOptions options = parse_arguments(argc, argv);
        if (options.verbose)
        {
            logger->set_level(spdlog::level::debug);
        }

        CommandLineConfiguration configuration{demo_command_line()};
        ProjectGraph projects = demo_projects();

        const Command& command = configuration.get_command(options.command_name);

        RunnerFactoryOptions runner_options;
        if (const auto* phased = std::get_if<PhasedCommand>(&command))
        {
            runner_options.incremental = phased->incremental;
            runner_options.build_cache_enabled = !phased->disable_build_cache;
        }
        if (options.production)
        {
            runner_options.parameter_values["--production"] = "";
        }

        auto factory = std::make_shared<ShellOperationRunnerFactory>(
            configuration,
            runner_options,
            std::make_shared<PosixProcessLauncher>(),
            nullptr,
            std::make_shared<InMemoryBuildCache>(),
            std::make_shared<BuildStateStore>());

        OperationGraphBuilder builder{configuration, projects, factory};
        OperationGraphPtr graph = builder.build(command, projects.all_projects());

        ExecutorConfig executor_config;
        executor_config.parallelism = options.parallelism;
        executor_config.logger = logger;
        ExecutorPtr executor = make_executor_for(command, executor_config);

        logger->info("Running \"{}\" with {} operations", options.command_name, graph->operation_count());

        ExecutionResult result;
        {
            InterruptWatcher watcher{[&executor, &logger] {
                logger->warn("Interrupted, waiting for running operations");
                executor->request_stop();
            }};
            result = executor->execute(graph);
        }

        return exit_code_for(result.verdict);
    }
    catch (const ConfigurationError& e)
    {
        logger->error("{}", e.what());
        return config_error_exit_code;
    }
    catch (const std::exception& e)
    {
        logger->error("{}", e.what());
        return EXIT_FAILURE;
    }
}
