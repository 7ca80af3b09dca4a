/**
 * @file parameter.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/config_enums.hpp"
#include "phasegraph/common/index_set.hpp"
#include "phasegraph/config/command_line_json.hpp"

namespace phasegraph
{

/**
 * @brief A custom command line parameter after binding.
 */
struct Parameter
{
    ParameterKind kind{ParameterKind::Flag};
    std::string long_name;
    std::optional<std::string> short_name;
    std::string description;
    bool required{false};

    /// Names as declared.
    std::vector<std::string> associated_commands;

    /// Names as declared, plus the synthetic phases of associated bulk commands.
    std::vector<std::string> associated_phases;

    std::vector<CommandIdx> command_indices;
    IndexSet phase_indices;

    std::vector<ChoiceAlternativeJson> alternatives;
    std::optional<std::string> default_value;
    std::optional<std::string> argument_name;
};

/**
 * @brief Values given for parameters on one invocation, keyed by long name.
 *
 * @details
 * A flag that is present maps to an empty string. Parameters that were not
 * given are absent from the map.
 */
using ParameterValues = std::unordered_map<std::string, std::string>;

/**
 * @brief Command line arguments forwarded to a script for one parameter.
 *
 * @details
 * Flags produce `{long_name}`; choice and string parameters produce
 * `{long_name, value}`. A choice parameter without a value falls back to its
 * default. Returns an empty vector when nothing should be forwarded.
 */
std::vector<std::string> format_parameter_arguments(const Parameter& parameter,
                                                    const ParameterValues& values);

} // namespace phasegraph
