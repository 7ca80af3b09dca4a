/**
 * @file operation_graph.hpp
 * @brief Operation and OperationGraph: the per-invocation execution plan.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/config_enums.hpp"
#include "phasegraph/common/index_set.hpp"
#include "phasegraph/execution/operation_runner.hpp"

namespace phasegraph
{

/**
 * @brief One unit of scheduled work: a (phase, project) pair, or the single
 *        run of a global command.
 *
 * @details
 * Execution status is not stored here. The executor tracks it in its own
 * per-run state, so an `OperationGraph` can be inspected freely while (and
 * after) it runs.
 */
struct Operation
{
    /// Display name, e.g. "app (_phase:build)" or the global command's name.
    std::string name;

    /// Unset for a global command.
    std::optional<PhaseIdx> phase;

    /// Unset for a global command.
    std::optional<ProjectIdx> project;

    OperationRunnerPtr runner;

    /// Operations that must reach a terminal state before this one starts.
    IndexSet dependencies;

    /// Operations that list this one as a dependency.
    IndexSet consumers;
};

/**
 * @brief The operation DAG for one command invocation.
 *
 * @details
 * Produced by `OperationGraphBuilder` and consumed by an executor. Operations
 * refer to each other by `OperationIdx`.
 *
 * @par Thread Safety
 * - Once built, the structure is not modified. Concurrent reads are safe.
 *
 * @par Lifetime
 * - Created fresh for every invocation and discarded after the run.
 */
struct OperationGraph
{
    std::vector<Operation> operations;

    size_t operation_count() const noexcept
    {
        return operations.size();
    }

    /**
     * @brief Indices of operations with no dependencies.
     */
    std::vector<OperationIdx> get_initial_ready_operations() const
    {
        std::vector<OperationIdx> result;
        for (OperationIdx idx = 0; idx < operations.size(); ++idx)
        {
            if (operations[idx].dependencies.empty())
            {
                result.push_back(idx);
            }
        }
        return result;
    }

    /**
     * @brief Find the operation for a (phase, project) pair.
     */
    std::optional<OperationIdx> find(PhaseIdx phase, ProjectIdx project) const
    {
        for (OperationIdx idx = 0; idx < operations.size(); ++idx)
        {
            if (operations[idx].phase == phase && operations[idx].project == project)
            {
                return idx;
            }
        }
        return std::nullopt;
    }
};

using OperationGraphPtr = std::shared_ptr<OperationGraph>;

} // namespace phasegraph
