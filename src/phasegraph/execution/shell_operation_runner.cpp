#include "phasegraph/execution/shell_operation_runner.hpp"
#include "phasegraph/common/errors.hpp"
#include "phasegraph/execution/null_operation_runner.hpp"
#include <fmt/format.h>

namespace phasegraph
{

ShellOperationRunner::ShellOperationRunner(ShellOperationRunnerOptions options,
                                           ProcessLauncherPtr launcher,
                                           StateHashProviderPtr hash_provider,
                                           BuildCachePtr cache,
                                           BuildStateStorePtr state_store)
    : m_options{std::move(options)}
    , m_launcher{std::move(launcher)}
    , m_hash_provider{std::move(hash_provider)}
    , m_cache{std::move(cache)}
    , m_state_store{std::move(state_store)}
{
    if (!m_launcher)
    {
        throw std::invalid_argument("ShellOperationRunner: \"" + m_options.name +
                                    "\" requires a process launcher");
    }
}

std::optional<std::string> ShellOperationRunner::fingerprint() const
{
    if (!m_hash_provider)
    {
        return std::nullopt;
    }
    auto state_hash = m_hash_provider->compute_state_hash(m_options.state_key);
    if (!state_hash)
    {
        return std::nullopt;
    }
    // The command line is part of the inputs: changed parameters must rerun.
    return *state_hash + "|" + m_options.command_line;
}

OperationRunResult ShellOperationRunner::execute(const OperationRunnerContext& context)
{
    const auto& logger = context.logger;
    std::optional<std::string> state_hash = fingerprint();

    // Reuse is only safe while no dependency produced new output in this run.
    bool may_reuse = context.is_skip_allowed && state_hash.has_value();

    if (m_options.incremental && may_reuse && m_state_store)
    {
        if (m_state_store->last_successful_hash(m_options.state_key) == state_hash)
        {
            return OperationRunResult{OperationStatus::Skipped, {}};
        }
    }

    std::string cache_key;
    if (state_hash)
    {
        cache_key = m_options.state_key + "@" + *state_hash;
    }

    if (m_options.build_cache_enabled && may_reuse && m_cache && m_cache->try_restore(cache_key))
    {
        if (m_state_store)
        {
            m_state_store->record_success(m_options.state_key, *state_hash);
        }
        return OperationRunResult{OperationStatus::FromCache, {}};
    }

    if (logger)
    {
        logger->debug("{}: invoking \"{}\" in \"{}\"",
                      m_options.name,
                      m_options.command_line,
                      m_options.working_directory);
    }

    ProcessResult process = m_launcher->run(
        ProcessRequest{m_options.command_line, m_options.working_directory}, context.cancellation);

    std::string output = process.stdout_output + process.stderr_output;

    if (process.cancelled)
    {
        if (m_state_store)
        {
            m_state_store->invalidate(m_options.state_key);
        }
        return OperationRunResult{OperationStatus::Failure,
                                  fmt::format("Terminated by cancellation\n{}", output)};
    }

    if (process.exit_code != 0)
    {
        if (m_state_store)
        {
            m_state_store->invalidate(m_options.state_key);
        }
        return OperationRunResult{
            OperationStatus::Failure,
            fmt::format("Returned error code: {}\n{}", process.exit_code, output)};
    }

    if (!process.stderr_output.empty())
    {
        if (m_state_store)
        {
            m_state_store->invalidate(m_options.state_key);
        }
        OperationStatus status = m_options.allow_warnings_on_success ? OperationStatus::SuccessWithWarning
                                                                     : OperationStatus::Failure;
        return OperationRunResult{status, std::move(output)};
    }

    if (state_hash)
    {
        if (m_state_store)
        {
            m_state_store->record_success(m_options.state_key, *state_hash);
        }
        if (m_options.build_cache_enabled && m_cache && !m_cache->try_store(cache_key) && logger)
        {
            logger->warn("{}: build cache entry was not written", m_options.name);
        }
    }

    return OperationRunResult{OperationStatus::Success, std::move(output)};
}

ShellOperationRunnerFactory::ShellOperationRunnerFactory(const CommandLineConfiguration& configuration,
                                                         RunnerFactoryOptions options,
                                                         ProcessLauncherPtr launcher,
                                                         StateHashProviderPtr hash_provider,
                                                         BuildCachePtr cache,
                                                         BuildStateStorePtr state_store)
    : m_configuration{configuration}
    , m_options{std::move(options)}
    , m_launcher{std::move(launcher)}
    , m_hash_provider{std::move(hash_provider)}
    , m_cache{std::move(cache)}
    , m_state_store{std::move(state_store)}
{
    if (!m_launcher)
    {
        throw std::invalid_argument("ShellOperationRunnerFactory requires a process launcher");
    }
}

OperationRunnerPtr ShellOperationRunnerFactory::create_phase_runner(const Phase& phase, const Project& project)
{
    std::string name = fmt::format("{} ({})", project.name, phase.name);

    auto it = project.scripts.find(phase.name);
    if (it == project.scripts.end())
    {
        if (phase.ignore_missing_script)
        {
            return std::make_shared<NullOperationRunner>(name, OperationStatus::NoOp, false);
        }
        throw ConfigurationError(
            ConfigurationErrorCode::MissingScript,
            fmt::format("The project \"{}\" does not define a \"{}\" command in the \"scripts\" "
                        "section of its package.json",
                        project.name,
                        phase.name));
    }

    if (it->second.empty())
    {
        return std::make_shared<NullOperationRunner>(name, OperationStatus::NoOp, false);
    }

    ShellOperationRunnerOptions options;
    options.name = std::move(name);
    options.command_line = append_parameters(it->second, phase.associated_parameters);
    options.working_directory = resolve_folder(project.folder);
    options.allow_warnings_on_success = phase.allow_warnings_on_success;
    options.incremental = m_options.incremental;
    options.build_cache_enabled = m_options.build_cache_enabled;
    options.state_key = project.name + ";" + phase.log_filename_identifier;

    return std::make_shared<ShellOperationRunner>(
        std::move(options), m_launcher, m_hash_provider, m_cache, m_state_store);
}

OperationRunnerPtr ShellOperationRunnerFactory::create_global_runner(const GlobalCommand& command)
{
    if (command.shell_command.empty())
    {
        return std::make_shared<NullOperationRunner>(command.name, OperationStatus::NoOp, false);
    }

    ShellOperationRunnerOptions options;
    options.name = command.name;
    options.command_line = append_parameters(command.shell_command, *command.associated_parameters);
    options.working_directory = m_options.repo_root;
    options.state_key = command.name;

    // Global commands are never skipped or cached.
    return std::make_shared<ShellOperationRunner>(std::move(options), m_launcher);
}

std::string ShellOperationRunnerFactory::append_parameters(std::string script,
                                                           const IndexSet& parameters) const
{
    for (ParameterIdx idx : parameters)
    {
        const Parameter& parameter = m_configuration.parameter(idx);
        for (const auto& argument : format_parameter_arguments(parameter, m_options.parameter_values))
        {
            script += ' ';
            script += quote_shell_argument(argument);
        }
    }
    return script;
}

std::string ShellOperationRunnerFactory::resolve_folder(const std::string& folder) const
{
    if (folder.empty())
    {
        return m_options.repo_root;
    }
    if (folder.front() == '/' || m_options.repo_root.empty())
    {
        return folder;
    }
    if (m_options.repo_root.back() == '/')
    {
        return m_options.repo_root + folder;
    }
    return m_options.repo_root + "/" + folder;
}

std::string ShellOperationRunnerFactory::quote_shell_argument(const std::string& argument)
{
    static const std::string safe_chars =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_=./:,+@%";

    if (!argument.empty() && argument.find_first_not_of(safe_chars) == std::string::npos)
    {
        return argument;
    }

    std::string quoted = "'";
    for (char ch : argument)
    {
        if (ch == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted += ch;
        }
    }
    quoted += '\'';
    return quoted;
}

} // namespace phasegraph
