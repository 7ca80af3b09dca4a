#include "phasegraph/config/parameter_binder.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace phasegraph
{

ParameterBinder::ParameterBinder(PhaseRegistry& phases, CommandRegistry& commands)
    : m_phases{phases}
    , m_commands{commands}
{}

Parameter ParameterBinder::bind(const ParameterJson& raw, ParameterIdx idx)
{
    Parameter parameter;
    parameter.kind = raw.parameter_kind;
    parameter.long_name = raw.long_name;
    parameter.short_name = raw.short_name;
    parameter.description = raw.description;
    parameter.required = raw.required;
    parameter.associated_commands = raw.associated_commands;
    parameter.associated_phases = raw.associated_phases;
    parameter.alternatives = raw.alternatives;
    parameter.default_value = raw.default_value;
    parameter.argument_name = raw.argument_name;

    if (parameter.kind == ParameterKind::Choice && parameter.default_value &&
        !parameter.default_value->empty())
    {
        std::vector<std::string> alternative_names;
        for (const auto& alternative : parameter.alternatives)
        {
            alternative_names.push_back(alternative.name);
        }
        if (std::find(alternative_names.begin(), alternative_names.end(),
                      *parameter.default_value) == alternative_names.end())
        {
            throw ConfigurationError(
                ConfigurationErrorCode::InvalidChoiceDefault,
                fmt::format("In {}, the parameter \"{}\", specifies a default value \"{}\" which is "
                            "not one of the defined alternatives: \"{}\"",
                            constants::command_line_filename, parameter.long_name,
                            *parameter.default_value, fmt::join(alternative_names, ",")));
        }
    }

    bool has_associated_commands = false;
    bool only_phased_commands = true;
    for (const auto& command_name : raw.associated_commands)
    {
        if (auto synthetic_phase = m_commands.synthetic_phase_for_bulk_command(command_name))
        {
            parameter.associated_phases.push_back(m_phases.at(*synthetic_phase).name);
        }

        auto command_idx = m_commands.find(command_name);
        if (!command_idx)
        {
            throw ConfigurationError(
                ConfigurationErrorCode::MissingCommand,
                fmt::format("{} defines a parameter \"{}\" that is associated with a command \"{}\" "
                            "that does not exist or does not support custom parameters.",
                            constants::command_line_filename, parameter.long_name, command_name));
        }

        const Command& command = m_commands.at(*command_idx);
        command_parameters(command)->insert(idx);
        parameter.command_indices.push_back(*command_idx);
        has_associated_commands = true;

        if (command_kind(command) != CommandKind::Phased)
        {
            only_phased_commands = false;
        }
    }

    bool has_associated_phases = false;
    for (const auto& phase_name : parameter.associated_phases)
    {
        auto phase_idx = m_phases.find(phase_name);
        if (!phase_idx)
        {
            throw ConfigurationError(
                ConfigurationErrorCode::MissingPhase,
                fmt::format("{} defines a parameter \"{}\" that is associated with a phase \"{}\" "
                            "that does not exist.",
                            constants::command_line_filename, parameter.long_name, phase_name));
        }
        m_phases.at(*phase_idx).associated_parameters.insert(idx);
        parameter.phase_indices.insert(*phase_idx);
        has_associated_phases = true;
    }

    if (!has_associated_commands)
    {
        throw ConfigurationError(
            ConfigurationErrorCode::ParameterWithoutCommand,
            fmt::format("{} defines a parameter \"{}\" that lists no associated commands.",
                        constants::command_line_filename, parameter.long_name));
    }

    if (only_phased_commands && !has_associated_phases)
    {
        throw ConfigurationError(
            ConfigurationErrorCode::ParameterWithoutPhase,
            fmt::format("{} defines a parameter \"{}\" that is only associated with phased "
                        "commands, but lists no associated phases.",
                        constants::command_line_filename, parameter.long_name));
    }

    return parameter;
}

} // namespace phasegraph
