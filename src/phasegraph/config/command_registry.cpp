#include "phasegraph/config/command_registry.hpp"
#include <fmt/format.h>

namespace phasegraph
{

namespace
{

bool is_build_command_name(const std::string& name)
{
    return name == constants::build_command_name || name == constants::rebuild_command_name;
}

template <typename T>
void fill_unset(std::optional<T>& target, const std::optional<T>& fallback)
{
    if (!target.has_value())
    {
        target = fallback;
    }
}

} // namespace

CommandRegistry::CommandRegistry(PhaseRegistry& phases)
    : m_phases{phases}
{}

// ============================================================================
// Defaults
// ============================================================================

CommandJson CommandRegistry::default_build_command_json()
{
    CommandJson json;
    json.command_kind = CommandKind::Bulk;
    json.name = constants::build_command_name;
    json.summary = "Build all projects that haven't been built, or have changed since they were "
                   "last built.";
    json.description =
        "This command is similar to \"rebuild\", except that \"build\" performs an incremental "
        "build. In other words, it only builds projects whose source files have changed since the "
        "last successful build.";
    json.safe_for_simultaneous_rush_processes = false;
    json.enable_parallelism = true;
    json.incremental = true;
    return json;
}

CommandJson CommandRegistry::default_rebuild_command_json()
{
    CommandJson json;
    json.command_kind = CommandKind::Bulk;
    json.name = constants::rebuild_command_name;
    json.summary = "Clean and rebuild the entire set of projects.";
    json.description =
        "This command assumes that each project defines a \"build\" script that performs a full "
        "clean build. Projects are built in parallel where possible, but always respecting the "
        "dependency graph.";
    json.safe_for_simultaneous_rush_processes = false;
    json.enable_parallelism = true;
    json.incremental = false;
    return json;
}

CommandJson CommandRegistry::merge_command_json(const CommandJson& defaults, const CommandJson& repo)
{
    CommandJson merged = repo;
    fill_unset(merged.summary, defaults.summary);
    fill_unset(merged.description, defaults.description);
    fill_unset(merged.safe_for_simultaneous_rush_processes,
               defaults.safe_for_simultaneous_rush_processes);
    fill_unset(merged.shell_command, defaults.shell_command);
    fill_unset(merged.enable_parallelism, defaults.enable_parallelism);
    fill_unset(merged.incremental, defaults.incremental);
    fill_unset(merged.ignore_dependency_order, defaults.ignore_dependency_order);
    fill_unset(merged.ignore_missing_script, defaults.ignore_missing_script);
    fill_unset(merged.allow_warnings_in_successful_build,
               defaults.allow_warnings_in_successful_build);
    fill_unset(merged.watch_for_changes, defaults.watch_for_changes);
    fill_unset(merged.disable_build_cache, defaults.disable_build_cache);
    fill_unset(merged.watch_options, defaults.watch_options);
    if (merged.phases.empty())
    {
        merged.phases = defaults.phases;
    }
    return merged;
}

// ============================================================================
// Loading
// ============================================================================

void CommandRegistry::add_declared_commands(const std::vector<CommandJson>& commands)
{
    for (const auto& raw : commands)
    {
        if (m_index_by_name.count(raw.name) != 0)
        {
            throw ConfigurationError(
                ConfigurationErrorCode::DuplicateCommandName,
                fmt::format("In {}, the command \"{}\" is specified more than once.",
                            constants::command_line_filename, raw.name));
        }

        Command normalized;
        switch (raw.command_kind)
        {
        case CommandKind::Global:
            normalized = normalize_global_command(raw);
            break;
        case CommandKind::Phased:
            normalized = normalize_phased_command(raw);
            break;
        case CommandKind::Bulk:
            normalized = translate_bulk_command(raw);
            break;
        }

        if (is_build_command_name(raw.name))
        {
            validate_build_command(raw, normalized);
            if (raw.name == constants::build_command_name)
            {
                m_build_command_phases = std::get<PhasedCommand>(normalized).phases;
            }
        }

        add_command(std::move(normalized));
    }
}

void CommandRegistry::add_default_build_commands()
{
    auto build_idx = find(constants::build_command_name);
    if (!build_idx)
    {
        CommandJson build_json = default_build_command_json();
        PhasedCommand build = translate_bulk_command(build_json);
        m_build_command_phases = build.phases;
        build_idx = add_command(std::move(build));
    }

    if (!find(constants::rebuild_command_name))
    {
        if (!m_build_command_phases)
        {
            throw ConfigurationError(
                ConfigurationErrorCode::MissingBuildPhases,
                fmt::format("Phases for the \"{}\" were not found.", constants::build_command_name));
        }

        CommandJson rebuild_json = default_rebuild_command_json();
        PhasedCommand rebuild;
        rebuild.name = rebuild_json.name;
        rebuild.summary = rebuild_json.summary.value_or("");
        rebuild.description = rebuild_json.description.value_or("");
        rebuild.safe_for_simultaneous_rush_processes = false;
        rebuild.is_synthetic = true;
        rebuild.enable_parallelism = rebuild_json.enable_parallelism.value_or(false);
        rebuild.incremental = rebuild_json.incremental.value_or(false);
        rebuild.disable_build_cache = rebuild_json.disable_build_cache.value_or(false);
        rebuild.phases = m_build_command_phases;
        rebuild.associated_parameters = command_parameters(at(*build_idx));
        rebuild.always_watch = false;
        add_command(std::move(rebuild));
    }
}

GlobalCommand CommandRegistry::normalize_global_command(const CommandJson& raw) const
{
    GlobalCommand command;
    command.name = raw.name;
    command.summary = raw.summary.value_or("");
    command.description = raw.description.value_or("");
    command.safe_for_simultaneous_rush_processes =
        raw.safe_for_simultaneous_rush_processes.value_or(false);
    command.shell_command = raw.shell_command.value_or("");
    return command;
}

PhasedCommand CommandRegistry::normalize_phased_command(const CommandJson& raw) const
{
    PhasedCommand command;
    command.name = raw.name;
    command.summary = raw.summary.value_or("");
    command.description = raw.description.value_or("");
    command.safe_for_simultaneous_rush_processes =
        raw.safe_for_simultaneous_rush_processes.value_or(false);
    command.is_synthetic = false;
    command.enable_parallelism = raw.enable_parallelism.value_or(false);
    command.incremental = raw.incremental.value_or(false);
    command.disable_build_cache = raw.disable_build_cache.value_or(false);

    for (const auto& phase_name : raw.phases)
    {
        auto phase = m_phases.find(phase_name);
        if (!phase)
        {
            throw ConfigurationError(
                ConfigurationErrorCode::MissingPhase,
                fmt::format("In {}, in the \"phases\" property of the \"{}\" command, the phase "
                            "\"{}\" does not exist.",
                            constants::command_line_filename, raw.name, phase_name));
        }
        command.phases->insert(*phase);
    }

    // Implicit expansion, the phase-level equivalent of selecting "--to".
    m_phases.expand_dependencies(*command.phases);

    if (raw.watch_options)
    {
        command.always_watch = raw.watch_options->always_watch;

        // Taken literally: no implicit expansion for watch mode.
        for (const auto& phase_name : raw.watch_options->watch_phases)
        {
            auto phase = m_phases.find(phase_name);
            if (!phase)
            {
                throw ConfigurationError(
                    ConfigurationErrorCode::MissingPhase,
                    fmt::format("In {}, in the \"watchPhases\" property of the \"{}\" command, "
                                "the phase \"{}\" does not exist.",
                                constants::command_line_filename, raw.name, phase_name));
            }
            command.watch_phases->insert(*phase);
        }
    }

    return command;
}

PhasedCommand CommandRegistry::translate_bulk_command(const CommandJson& raw)
{
    PhaseIdx phase = m_phases.add_synthetic_phase(
        raw.name,
        raw.ignore_missing_script.value_or(false),
        raw.allow_warnings_in_successful_build.value_or(false),
        !raw.ignore_dependency_order.value_or(false));
    m_synthetic_phase_by_bulk_command[raw.name] = phase;

    PhasedCommand command;
    command.name = raw.name;
    command.summary = raw.summary.value_or("");
    command.description = raw.description.value_or("");
    command.safe_for_simultaneous_rush_processes =
        raw.safe_for_simultaneous_rush_processes.value_or(false);
    command.is_synthetic = true;
    command.enable_parallelism = raw.enable_parallelism.value_or(false);
    command.incremental = raw.incremental.value_or(false);
    command.disable_build_cache = raw.disable_build_cache.value_or(false);
    command.phases->insert(phase);

    // Bulk commands watch the same phases they run.
    if (raw.watch_for_changes.value_or(false))
    {
        command.watch_phases = command.phases;
        command.always_watch = true;
    }

    return command;
}

void CommandRegistry::validate_build_command(const CommandJson& raw, const Command& normalized) const
{
    if (command_kind(normalized) == CommandKind::Global)
    {
        throw ConfigurationError(
            ConfigurationErrorCode::InvalidBuildCommandKind,
            fmt::format("{} defines a command \"{}\" using the command kind \"{}\". This command "
                        "can only be designated as a command kind \"{}\" or \"{}\".",
                        constants::command_line_filename, raw.name,
                        constants::global_command_kind, constants::bulk_command_kind,
                        constants::phased_command_kind));
    }

    if (raw.safe_for_simultaneous_rush_processes.value_or(false))
    {
        throw ConfigurationError(
            ConfigurationErrorCode::UnsafeBuildCommand,
            fmt::format("{} defines a command \"{}\" using \"safeForSimultaneousRushProcesses=true\". "
                        "This configuration is not supported for \"{}\".",
                        constants::command_line_filename, raw.name, raw.name));
    }
}

CommandIdx CommandRegistry::add_command(Command command)
{
    CommandIdx idx = m_commands.size();
    m_index_by_name.emplace(command_name(command), idx);
    m_commands.push_back(std::move(command));
    return idx;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<CommandIdx> CommandRegistry::find(const std::string& name) const
{
    auto it = m_index_by_name.find(name);
    if (it == m_index_by_name.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const Command& CommandRegistry::at(CommandIdx idx) const
{
    if (idx >= m_commands.size())
    {
        throw std::out_of_range("CommandRegistry::at: command index " + std::to_string(idx) +
                                " does not exist");
    }
    return m_commands[idx];
}

Command& CommandRegistry::at(CommandIdx idx)
{
    if (idx >= m_commands.size())
    {
        throw std::out_of_range("CommandRegistry::at: command index " + std::to_string(idx) +
                                " does not exist");
    }
    return m_commands[idx];
}

std::optional<PhaseIdx> CommandRegistry::synthetic_phase_for_bulk_command(const std::string& name) const
{
    auto it = m_synthetic_phase_by_bulk_command.find(name);
    if (it == m_synthetic_phase_by_bulk_command.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace phasegraph
