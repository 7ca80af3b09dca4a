/**
 * @file phase.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/config_enums.hpp"
#include "phasegraph/common/index_set.hpp"

namespace phasegraph
{

/**
 * @brief Resolved dependencies of a phase, as indices into the phase registry.
 */
struct PhaseDependencies
{
    /// Phases that must complete earlier within the same project.
    IndexSet self;

    /// Phases that must complete earlier in every upstream project. A phase
    /// listing itself here means "build dependencies before dependents".
    IndexSet upstream;
};

/**
 * @brief A named unit of work that runs once per project.
 */
struct Phase
{
    std::string name;

    /// True if the phase was generated from a bulk command rather than declared.
    bool is_synthetic{false};

    /// Filesystem-safe form of the name, used for log file names.
    std::string log_filename_identifier;

    /// Parameters whose values are forwarded to this phase's scripts.
    IndexSet associated_parameters;

    PhaseDependencies dependencies;

    /// Projects without a script for this phase get a no-op instead of an error.
    bool ignore_missing_script{false};

    /// Warnings produce SuccessWithWarning instead of Failure.
    bool allow_warnings_on_success{false};
};

} // namespace phasegraph
