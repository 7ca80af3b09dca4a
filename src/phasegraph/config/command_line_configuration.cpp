#include "phasegraph/config/command_line_configuration.hpp"
#include "phasegraph/config/parameter_binder.hpp"
#include <fmt/format.h>

namespace phasegraph
{

CommandLineConfiguration::CommandLineConfiguration(const CommandLineJson& json,
                                                   CommandLineConfigurationOptions options)
    : m_phases{std::make_unique<PhaseRegistry>()}
    , m_commands{}
    , m_parameters{}
{
    m_commands = std::make_unique<CommandRegistry>(*m_phases);

    m_phases->add_declared_phases(json.phases);
    m_commands->add_declared_commands(json.commands);

    if (options.include_default_build_commands)
    {
        m_commands->add_default_build_commands();
    }

    ParameterBinder binder(*m_phases, *m_commands);
    m_parameters.reserve(json.parameters.size());
    for (const auto& raw : json.parameters)
    {
        m_parameters.push_back(binder.bind(raw, m_parameters.size()));
    }
}

CommandLineJson CommandLineConfiguration::merge_default_build_commands(CommandLineJson json)
{
    for (auto& command : json.commands)
    {
        if (command.command_kind != CommandKind::Bulk && command.command_kind != CommandKind::Phased)
        {
            continue;
        }
        if (command.name == constants::build_command_name)
        {
            command = CommandRegistry::merge_command_json(
                CommandRegistry::default_build_command_json(), command);
        }
        else if (command.name == constants::rebuild_command_name)
        {
            command = CommandRegistry::merge_command_json(
                CommandRegistry::default_rebuild_command_json(), command);
        }
    }
    return json;
}

const Command& CommandLineConfiguration::get_command(const std::string& name) const
{
    auto idx = m_commands->find(name);
    if (!idx)
    {
        throw ConfigurationError(
            ConfigurationErrorCode::MissingCommand,
            fmt::format("The command \"{}\" is not defined in {}.", name,
                        constants::command_line_filename));
    }
    return m_commands->at(*idx);
}

const PhasedCommand& CommandLineConfiguration::get_phased_command(const std::string& name) const
{
    const Command& command = get_command(name);
    if (const auto* phased = std::get_if<PhasedCommand>(&command))
    {
        return *phased;
    }
    throw ConfigurationError(
        ConfigurationErrorCode::WrongCommandKind,
        fmt::format("The command \"{}\" is not a \"{}\" command.", name,
                    constants::phased_command_kind));
}

const GlobalCommand& CommandLineConfiguration::get_global_command(const std::string& name) const
{
    const Command& command = get_command(name);
    if (const auto* global = std::get_if<GlobalCommand>(&command))
    {
        return *global;
    }
    throw ConfigurationError(
        ConfigurationErrorCode::WrongCommandKind,
        fmt::format("The command \"{}\" is not a \"{}\" command.", name,
                    constants::global_command_kind));
}

} // namespace phasegraph
