/**
 * @file operation_runner.hpp
 * @brief IOperationRunner and IOperationRunnerFactory interfaces.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/cancellation_token.hpp"
#include "phasegraph/common/logging.hpp"
#include "phasegraph/config/command.hpp"
#include "phasegraph/config/phase.hpp"
#include "phasegraph/execution/operation_status.hpp"
#include "phasegraph/graph/project_graph.hpp"

namespace phasegraph
{

struct Operation;

/**
 * @brief Everything a runner gets to see while executing.
 */
struct OperationRunnerContext
{
    /// The operation being executed.
    const Operation& operation;

    /// Set when the executor stops; runners wind down in-flight work early.
    CancellationToken cancellation;

    LoggerPtr logger;

    /// False when a dependency actually ran in this invocation; the runner
    /// must not report Skipped or restore from cache.
    bool is_skip_allowed{true};
};

/**
 * @brief Outcome reported by a runner.
 */
struct OperationRunResult
{
    /// One of the terminal states other than Blocked.
    OperationStatus status{OperationStatus::Success};

    /// Optional diagnostic output (process output, failure reason).
    std::string output;
};

/**
 * @brief Interface for the work behind one operation.
 *
 * @details
 * The scheduler knows nothing about processes, hashes or caches. It calls
 * `execute()` once all dependencies have finished and consumes the returned
 * status. A runner decides by itself whether the work can be skipped, restored
 * from cache, or must actually run.
 *
 * @par Thread Safety
 * - `execute()` may be called from any worker thread, but at most once per
 *   runner instance and never concurrently with itself.
 *
 * @par Errors
 * - Exceptions thrown by `execute()` are caught by the executor and turn the
 *   operation into Failure, with the exception text as output.
 */
class IOperationRunner
{
public:
    virtual ~IOperationRunner() = default;

    /**
     * @brief Name to report in logs.
     */
    virtual const std::string& name() const = 0;

    /**
     * @brief If true, the operation is not logged individually.
     */
    virtual bool silent() const noexcept
    {
        return false;
    }

    /**
     * @brief Do the work.
     * @param context Execution context for this operation.
     * @return The operation's outcome.
     */
    virtual OperationRunResult execute(const OperationRunnerContext& context) = 0;
};

using OperationRunnerPtr = std::shared_ptr<IOperationRunner>;

/**
 * @brief Creates the runner for each operation while the graph is built.
 */
class IOperationRunnerFactory
{
public:
    virtual ~IOperationRunnerFactory() = default;

    /**
     * @brief Runner for one (phase, project) operation.
     * @throw ConfigurationError if the project cannot run the phase.
     */
    virtual OperationRunnerPtr create_phase_runner(const Phase& phase, const Project& project) = 0;

    /**
     * @brief Runner for the single operation of a global command.
     */
    virtual OperationRunnerPtr create_global_runner(const GlobalCommand& command) = 0;
};

using OperationRunnerFactoryPtr = std::shared_ptr<IOperationRunnerFactory>;

} // namespace phasegraph
