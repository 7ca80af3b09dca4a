/**
 * @file shell_operation_runner.hpp
 * @brief Runner that executes a project script, and the factory that builds it.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/config/command_line_configuration.hpp"
#include "phasegraph/config/parameter.hpp"
#include "phasegraph/execution/build_cache.hpp"
#include "phasegraph/execution/operation_runner.hpp"
#include "phasegraph/execution/process_launcher.hpp"

namespace phasegraph
{

struct ShellOperationRunnerOptions
{
    std::string name;

    /// Full shell text: the project script followed by formatted parameters.
    std::string command_line;

    std::string working_directory;

    bool allow_warnings_on_success{false};
    bool incremental{false};
    bool build_cache_enabled{false};

    /// Stable identity of the operation across invocations.
    std::string state_key;
};

/**
 * @brief Runs one project script through an `IProcessLauncher`.
 *
 * @details
 * Before spawning anything the runner fingerprints the operation's inputs:
 * - With `incremental` set, an unchanged fingerprint since the last successful
 *   run yields Skipped.
 * - With `build_cache_enabled` set, a cache hit yields FromCache.
 *
 * Neither applies when the context's `is_skip_allowed` is false, i.e. a
 * dependency actually executed earlier in the same run.
 *
 * Otherwise the process runs. A non-zero exit code is Failure. Output on
 * stderr with exit code zero is SuccessWithWarning when warnings are allowed
 * for the phase, and Failure otherwise.
 *
 * The hash provider, cache and state store are optional; without them the
 * script always runs.
 */
class ShellOperationRunner : public IOperationRunner
{
public:
    ShellOperationRunner(ShellOperationRunnerOptions options,
                         ProcessLauncherPtr launcher,
                         StateHashProviderPtr hash_provider = nullptr,
                         BuildCachePtr cache = nullptr,
                         BuildStateStorePtr state_store = nullptr);

    const std::string& name() const override
    {
        return m_options.name;
    }

    const ShellOperationRunnerOptions& options() const noexcept
    {
        return m_options;
    }

    OperationRunResult execute(const OperationRunnerContext& context) override;

private:
    std::optional<std::string> fingerprint() const;

    ShellOperationRunnerOptions m_options;
    ProcessLauncherPtr m_launcher;
    StateHashProviderPtr m_hash_provider;
    BuildCachePtr m_cache;
    BuildStateStorePtr m_state_store;
};

/**
 * @brief Invocation-wide settings for `ShellOperationRunnerFactory`.
 */
struct RunnerFactoryOptions
{
    /// Relative project folders are resolved against this directory.
    std::string repo_root;

    bool incremental{false};
    bool build_cache_enabled{false};

    /// Values supplied for parameters, keyed by long name.
    ParameterValues parameter_values;
};

/**
 * @brief Chooses the runner for each operation from the project's scripts.
 *
 * @details
 * For a (phase, project) pair the script is looked up by phase name:
 * - Missing script: NoOp if the phase has `ignore_missing_script`, otherwise
 *   a `ConfigurationError` naming both the project and the phase.
 * - Empty script: NoOp.
 * - Otherwise a `ShellOperationRunner`, with the phase's associated
 *   parameters appended to the script.
 */
class ShellOperationRunnerFactory : public IOperationRunnerFactory
{
public:
    ShellOperationRunnerFactory(const CommandLineConfiguration& configuration,
                                RunnerFactoryOptions options,
                                ProcessLauncherPtr launcher,
                                StateHashProviderPtr hash_provider = nullptr,
                                BuildCachePtr cache = nullptr,
                                BuildStateStorePtr state_store = nullptr);

    OperationRunnerPtr create_phase_runner(const Phase& phase, const Project& project) override;
    OperationRunnerPtr create_global_runner(const GlobalCommand& command) override;

    /**
     * @brief Quote a single argument for `/bin/sh` when it needs quoting.
     */
    static std::string quote_shell_argument(const std::string& argument);

private:
    std::string append_parameters(std::string script, const IndexSet& parameters) const;
    std::string resolve_folder(const std::string& folder) const;

    const CommandLineConfiguration& m_configuration;
    RunnerFactoryOptions m_options;
    ProcessLauncherPtr m_launcher;
    StateHashProviderPtr m_hash_provider;
    BuildCachePtr m_cache;
    BuildStateStorePtr m_state_store;
};

} // namespace phasegraph
