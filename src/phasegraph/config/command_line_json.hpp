/**
 * @file command_line_json.hpp
 * @brief Resolved, schema-checked command line declarations.
 *
 * @details
 * These structs mirror the shape of a command-line.json file after it has been
 * parsed and schema-validated by the caller. Optional members distinguish
 * "not specified" from an explicit value, which matters when repository
 * declarations are merged over the default build/rebuild commands.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/config_enums.hpp"

namespace phasegraph
{

/**
 * @brief A phase as declared in configuration.
 */
struct PhaseJson
{
    std::string name;

    /// Phases that must complete first within the same project.
    std::vector<std::string> self_dependencies;

    /// Phases that must complete first in every upstream project.
    std::vector<std::string> upstream_dependencies;

    bool ignore_missing_script{false};
    bool allow_warnings_on_success{false};
};

/**
 * @brief Watch-mode settings of a phased command.
 */
struct WatchOptionsJson
{
    bool always_watch{false};
    std::vector<std::string> watch_phases;
};

/**
 * @brief A command as declared in configuration (global, bulk or phased).
 *
 * @details
 * Only the members relevant to `command_kind` are consulted:
 * - Global: `shell_command`.
 * - Bulk: `enable_parallelism`, `incremental`, `ignore_dependency_order`,
 *   `ignore_missing_script`, `allow_warnings_in_successful_build`,
 *   `watch_for_changes`, `disable_build_cache`.
 * - Phased: `phases`, `watch_options`, `enable_parallelism`, `incremental`,
 *   `disable_build_cache`.
 */
struct CommandJson
{
    CommandKind command_kind{CommandKind::Bulk};
    std::string name;

    std::optional<std::string> summary;
    std::optional<std::string> description;
    std::optional<bool> safe_for_simultaneous_rush_processes;

    std::optional<std::string> shell_command;

    std::optional<bool> enable_parallelism;
    std::optional<bool> incremental;
    std::optional<bool> ignore_dependency_order;
    std::optional<bool> ignore_missing_script;
    std::optional<bool> allow_warnings_in_successful_build;
    std::optional<bool> watch_for_changes;
    std::optional<bool> disable_build_cache;

    std::vector<std::string> phases;
    std::optional<WatchOptionsJson> watch_options;
};

/**
 * @brief One alternative of a choice parameter.
 */
struct ChoiceAlternativeJson
{
    std::string name;
    std::string description;
};

/**
 * @brief A custom command line parameter as declared in configuration.
 */
struct ParameterJson
{
    ParameterKind parameter_kind{ParameterKind::Flag};
    std::string long_name;
    std::optional<std::string> short_name;
    std::string description;
    bool required{false};

    std::vector<std::string> associated_commands;
    std::vector<std::string> associated_phases;

    /// Choice parameters only.
    std::vector<ChoiceAlternativeJson> alternatives;
    std::optional<std::string> default_value;

    /// String parameters only.
    std::optional<std::string> argument_name;
};

/**
 * @brief The whole resolved command line configuration.
 */
struct CommandLineJson
{
    std::vector<PhaseJson> phases;
    std::vector<CommandJson> commands;
    std::vector<ParameterJson> parameters;
};

} // namespace phasegraph
