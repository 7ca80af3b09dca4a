/**
 * @file constants.hpp
 * @brief Names and keywords shared by configuration and execution.
 */
#pragma once
#include "phasegraph/common/common.hpp"

namespace phasegraph
{
namespace constants
{

/// File name used as the subject of configuration error messages.
inline constexpr const char* command_line_filename = "command-line.json";

/// Every declared (non-synthetic) phase name starts with this prefix.
inline constexpr const char* phase_name_prefix = "_phase:";

inline constexpr const char* build_command_name = "build";
inline constexpr const char* rebuild_command_name = "rebuild";

inline constexpr const char* global_command_kind = "global";
inline constexpr const char* bulk_command_kind = "bulk";
inline constexpr const char* phased_command_kind = "phased";

} // namespace constants
} // namespace phasegraph
