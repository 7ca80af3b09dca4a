/**
 * @file command_line_configuration.hpp
 * @brief Validated, cross-referenced phases, commands and parameters.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/errors.hpp"
#include "phasegraph/config/command_line_json.hpp"
#include "phasegraph/config/command_registry.hpp"
#include "phasegraph/config/parameter.hpp"
#include "phasegraph/config/phase_registry.hpp"

namespace phasegraph
{

/**
 * @brief Options for constructing a CommandLineConfiguration.
 */
struct CommandLineConfigurationOptions
{
    /**
     * @brief Whether to add the default "build" and "rebuild" commands.
     * @details Disabled for configuration files contributed by plugins.
     */
    bool include_default_build_commands{true};
};

/**
 * @brief The loaded command line configuration.
 *
 * @details
 * Construction runs the whole load pipeline, failing fast with a
 * `ConfigurationError` that names the offending entity:
 * 1. Phases (`PhaseRegistry::add_declared_phases`).
 * 2. Commands, including bulk translation (`CommandRegistry::add_declared_commands`).
 * 3. Default build/rebuild commands, unless disabled.
 * 4. Parameters (`ParameterBinder`).
 *
 * A successfully constructed instance is immutable in practice; the operation
 * graph builder and runner factories only read from it.
 *
 * @par Thread safety
 * - No internal synchronization. Concurrent reads are safe.
 */
class CommandLineConfiguration
{
public:
    explicit CommandLineConfiguration(const CommandLineJson& json,
                                      CommandLineConfigurationOptions options = {});

    CommandLineConfiguration(const CommandLineConfiguration&) = delete;
    CommandLineConfiguration& operator=(const CommandLineConfiguration&) = delete;

    /**
     * @brief Fill unset members of declared "build"/"rebuild" commands from the defaults.
     *
     * @details
     * Applies only to bulk or phased commands named "build" or "rebuild".
     * This is a shallow, member-by-member merge in which repository values win.
     * Call this on repository configuration before constructing.
     */
    static CommandLineJson merge_default_build_commands(CommandLineJson json);

    const PhaseRegistry& phases() const noexcept
    {
        return *m_phases;
    }

    const CommandRegistry& commands() const noexcept
    {
        return *m_commands;
    }

    const std::vector<Parameter>& parameters() const noexcept
    {
        return m_parameters;
    }

    /**
     * @throw std::out_of_range for an invalid index.
     */
    const Parameter& parameter(ParameterIdx idx) const
    {
        return m_parameters.at(idx);
    }

    /**
     * @brief Look up a command by name.
     * @throw ConfigurationError with `MissingCommand` if there is no such command.
     */
    const Command& get_command(const std::string& name) const;

    /**
     * @brief Look up a phased command by name.
     * @throw ConfigurationError with `MissingCommand` or `WrongCommandKind`.
     */
    const PhasedCommand& get_phased_command(const std::string& name) const;

    /**
     * @brief Look up a global command by name.
     * @throw ConfigurationError with `MissingCommand` or `WrongCommandKind`.
     */
    const GlobalCommand& get_global_command(const std::string& name) const;

private:
    std::unique_ptr<PhaseRegistry> m_phases;
    std::unique_ptr<CommandRegistry> m_commands;
    std::vector<Parameter> m_parameters;
};

} // namespace phasegraph
