/**
 * @file operation_graph_builder.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/errors.hpp"
#include "phasegraph/config/command_line_configuration.hpp"
#include "phasegraph/execution/operation_runner.hpp"
#include "phasegraph/graph/operation_graph.hpp"
#include "phasegraph/graph/project_graph.hpp"

namespace phasegraph
{

/**
 * @brief Builds the operation DAG for one command invocation.
 *
 * @details
 * For a phased command, one operation is created per (phase, project) pair,
 * for every phase in the command's phase set and every project in scope. Edges:
 * - (phase, project) depends on (self_dep, project) for each self dependency.
 * - (phase, project) depends on (upstream_dep, upstream_project) for each
 *   upstream dependency and each nearest selected upstream project of
 *   `project`. Unselected upstream projects are looked through, so for
 *   a <- b <- c with only a and c selected, c still waits for a.
 *
 * A dependency whose operation is not part of the graph (a phase outside a
 * literal watch set, or an upstream chain with no selected project) is not
 * wired; the selection is assumed to be up to date for it.
 *
 * A global command produces a single operation with no project.
 *
 * The builder trusts its inputs to be acyclic: the phase registry rejected
 * self-dependency cycles and the project graph is acyclic by contract.
 *
 * @par Thread Safety
 * - `build*()` are const and may be called concurrently if the runner
 *   factory tolerates it.
 */
class OperationGraphBuilder
{
public:
    /**
     * @param configuration Loaded configuration; must outlive the builder.
     * @param projects Project graph; must outlive the builder.
     * @param runner_factory Creates a runner for every operation.
     */
    OperationGraphBuilder(const CommandLineConfiguration& configuration,
                          const ProjectGraph& projects,
                          OperationRunnerFactoryPtr runner_factory);

    /**
     * @brief Build the graph for a command.
     * @param command The command to run.
     * @param projects Projects in scope (ignored for global commands).
     * @param watch If true, a phased command uses its watch phases.
     * @throw ConfigurationError if a runner cannot be created.
     * @throw GraphConsistencyError on a dangling index.
     */
    OperationGraphPtr build(const Command& command,
                            const std::vector<ProjectIdx>& projects,
                            bool watch = false) const;

    /**
     * @brief Build the graph for an explicit phase set.
     */
    OperationGraphPtr build_phased(const IndexSet& phases,
                                   const std::vector<ProjectIdx>& projects) const;

    /**
     * @brief Build the single-operation graph for a global command.
     */
    OperationGraphPtr build_global(const GlobalCommand& command) const;

private:
    /**
     * @brief Upstream projects of @p project that are in @p selection.
     * @details Unselected upstream projects are looked through, so ordering
     * still holds across projects left out of the run.
     */
    std::vector<ProjectIdx> nearest_selected_upstream(const Project& project, const IndexSet& selection) const;

    const Phase& checked_phase(PhaseIdx idx) const;
    const Project& checked_project(ProjectIdx idx) const;
    OperationRunnerPtr checked_runner(OperationRunnerPtr runner, const std::string& name) const;

    const CommandLineConfiguration& m_configuration;
    const ProjectGraph& m_projects;
    OperationRunnerFactoryPtr m_runner_factory;
};

} // namespace phasegraph
