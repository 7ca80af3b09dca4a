/**
 * @file command.hpp
 * @brief Normalized command types: global and phased.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/config_enums.hpp"
#include "phasegraph/common/index_set.hpp"

namespace phasegraph
{

/**
 * @brief Shared handle to a command's set of associated parameter indices.
 *
 * @details
 * The handle is shared (not copied) when the default "rebuild" command is
 * synthesized from "build", so both commands observe the same set.
 */
using ParameterSetPtr = std::shared_ptr<IndexSet>;

/**
 * @brief Shared handle to a phased command's phase set.
 */
using PhaseSetPtr = std::shared_ptr<IndexSet>;

/**
 * @brief A command that runs one shell command once, independent of projects.
 */
struct GlobalCommand
{
    std::string name;
    std::string summary;
    std::string description;
    bool safe_for_simultaneous_rush_processes{false};
    ParameterSetPtr associated_parameters{std::make_shared<IndexSet>()};

    std::string shell_command;
};

/**
 * @brief A command that runs a set of phases for every project in scope.
 *
 * @details
 * `phases` is closed under self and upstream dependencies. `watch_phases` is
 * taken literally from configuration, without implicit expansion.
 */
struct PhasedCommand
{
    std::string name;
    std::string summary;
    std::string description;
    bool safe_for_simultaneous_rush_processes{false};
    ParameterSetPtr associated_parameters{std::make_shared<IndexSet>()};

    /// True if generated from a bulk command or synthesized as a default.
    bool is_synthetic{false};

    bool enable_parallelism{false};
    bool incremental{false};
    bool disable_build_cache{false};

    PhaseSetPtr phases{std::make_shared<IndexSet>()};

    bool always_watch{false};
    PhaseSetPtr watch_phases{std::make_shared<IndexSet>()};
};

/**
 * @brief A normalized command. Bulk commands never appear here; they are
 *        translated to `PhasedCommand` while loading.
 */
using Command = std::variant<GlobalCommand, PhasedCommand>;

/**
 * @brief Name of a command, whatever its kind.
 */
inline const std::string& command_name(const Command& command)
{
    return std::visit([](const auto& c) -> const std::string& { return c.name; }, command);
}

/**
 * @brief Kind of a normalized command (never `CommandKind::Bulk`).
 */
inline CommandKind command_kind(const Command& command) noexcept
{
    return std::holds_alternative<GlobalCommand>(command) ? CommandKind::Global
                                                          : CommandKind::Phased;
}

inline const ParameterSetPtr& command_parameters(const Command& command)
{
    return std::visit([](const auto& c) -> const ParameterSetPtr& { return c.associated_parameters; },
                      command);
}

} // namespace phasegraph
