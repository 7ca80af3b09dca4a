/**
 * @file parameter_binder.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/errors.hpp"
#include "phasegraph/config/command_registry.hpp"
#include "phasegraph/config/parameter.hpp"
#include "phasegraph/config/phase_registry.hpp"

namespace phasegraph
{

/**
 * @brief Associates custom parameters with commands and phases.
 *
 * @details
 * For each declared parameter the binder:
 * 1. Checks that a choice parameter's default is one of its alternatives.
 * 2. Resolves every associated command by name and adds the parameter to the
 *    command's parameter set. If the command was a translated bulk command,
 *    its synthetic phase is appended to the parameter's associated phases.
 * 3. Resolves every associated phase by name and adds the parameter to the
 *    phase's parameter set.
 * 4. Rejects parameters with no associated command, and parameters associated
 *    only with phased commands that list no phase. Phased commands hand
 *    parameters to scripts per phase, so such a parameter would be unreachable.
 *
 * @par Ownership
 * - The binder mutates the registries it was given; both must outlive it.
 */
class ParameterBinder
{
public:
    ParameterBinder(PhaseRegistry& phases, CommandRegistry& commands);

    /**
     * @brief Validate and bind one parameter.
     * @param raw The declaration.
     * @param idx Index the parameter will have in the configuration's list.
     * @return The bound parameter.
     * @throw ConfigurationError if any check fails.
     */
    Parameter bind(const ParameterJson& raw, ParameterIdx idx);

private:
    PhaseRegistry& m_phases;
    CommandRegistry& m_commands;
};

} // namespace phasegraph
