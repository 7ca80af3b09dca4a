/**
 * @file config_enums.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/constants.hpp"

namespace phasegraph
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for phase indices.
 *
 * @details
 * `PhaseIdx` identifies a phase inside a `PhaseRegistry`. Phases refer to each
 * other by index rather than by pointer, so the registry can be copied and
 * the dependency graph holds no ownership cycles.
 */
using PhaseIdx = size_t;

/**
 * @brief Type alias for command indices inside a `CommandRegistry`.
 */
using CommandIdx = size_t;

/**
 * @brief Type alias for parameter indices inside a `CommandLineConfiguration`.
 */
using ParameterIdx = size_t;

/**
 * @brief Type alias for project indices inside a `ProjectGraph`.
 */
using ProjectIdx = size_t;

/**
 * @brief Type alias for operation indices inside an `OperationGraph`.
 */
using OperationIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Kind of a declared command.
 *
 * @details
 * `Bulk` only exists on the input side: every bulk command is translated into
 * a `Phased` command with one synthetic phase while the configuration loads.
 */
enum class CommandKind
{
    Global,
    Bulk,
    Phased
};

/**
 * @brief Kind of a custom command line parameter.
 */
enum class ParameterKind
{
    Flag,
    Choice,
    String
};

/**
 * @brief Keyword used for a command kind in configuration files and messages.
 */
inline const char* to_string(CommandKind kind) noexcept
{
    switch (kind)
    {
    case CommandKind::Global:
        return constants::global_command_kind;
    case CommandKind::Bulk:
        return constants::bulk_command_kind;
    case CommandKind::Phased:
        return constants::phased_command_kind;
    }
    return "unknown";
}

inline const char* to_string(ParameterKind kind) noexcept
{
    switch (kind)
    {
    case ParameterKind::Flag:
        return "flag";
    case ParameterKind::Choice:
        return "choice";
    case ParameterKind::String:
        return "string";
    }
    return "unknown";
}

} // namespace phasegraph
