/**
 * @file executor.hpp
 * @brief IExecutor interface, ExecutorConfig and the shared Executor base.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/cancellation_token.hpp"
#include "phasegraph/common/logging.hpp"
#include "phasegraph/config/command.hpp"
#include "phasegraph/execution/execution_result.hpp"
#include "phasegraph/execution/operation_task.hpp"
#include "phasegraph/graph/operation_graph.hpp"

namespace phasegraph
{

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Maximum number of operations executing at once.
     * @details 0 means use std::thread::hardware_concurrency().
     */
    size_t parallelism{0};

    /**
     * @brief Stop dispatching once this much time has passed.
     */
    std::optional<std::chrono::milliseconds> timeout;

    /// Null means discard log output.
    LoggerPtr logger;
};

/**
 * @brief Interface for operation graph executors.
 *
 * @par Thread Safety
 * - execute() may be called from any thread, once per executor.
 * - request_stop() may be called from any thread during execution.
 * - stop_requested() may be called from any thread.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Run every operation of the graph in dependency order.
     * @return ExecutionResult with outcome details.
     * @throw GraphConsistencyError if the graph cannot make progress.
     */
    virtual ExecutionResult execute(OperationGraphPtr graph) = 0;

    /**
     * @brief Request graceful stop of execution.
     *
     * @details
     * No further operations are dispatched. In-flight runners see the
     * cancellation token set and may finish early; the executor still waits
     * for them. The request is sticky.
     */
    virtual void request_stop() = 0;

    virtual bool stop_requested() const noexcept = 0;
};

using ExecutorPtr = std::shared_ptr<IExecutor>;

/**
 * @brief Base class for Executor implementations.
 *
 * @details
 * Provides what every scheduling strategy shares:
 * - Stop request handling through a `CancellationToken`.
 * - Invoking a runner, converting exceptions into Failure.
 * - Applying a completion: recording it, blocking consumers transitively on
 *   Failure/Blocked, and releasing consumers whose dependencies are done.
 * - Building the final `ExecutionResult`.
 *
 * Derived classes decide where runners execute.
 */
class Executor : public IExecutor
{
public:
    explicit Executor(ExecutorConfig config);

    void request_stop() override;
    bool stop_requested() const noexcept override;

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

protected:
    /**
     * @brief Hook for derived classes to wake their coordinating thread.
     */
    virtual void on_stop_requested() {}

    std::vector<OperationTask> create_tasks(const OperationGraph& graph) const;

    /**
     * @brief Call the operation's runner.
     * @param skip_allowed The task's `skip_allowed()` at dispatch time.
     * @details Never throws: exceptions and non-terminal statuses become Failure.
     */
    OperationRunResult invoke_runner(const Operation& operation, bool skip_allowed) const;

    /**
     * @brief Apply the outcome of an executed operation.
     * @return Consumers that just became ready, in consumer order.
     */
    std::vector<OperationIdx> complete_operation(const OperationGraph& graph,
                                                 std::vector<OperationTask>& tasks,
                                                 OperationIdx idx,
                                                 OperationRunResult run,
                                                 std::chrono::nanoseconds duration,
                                                 ExecutionResult& result) const;

    /**
     * @brief Fill in verdict, final statuses and timing once dispatching ends.
     * @throw GraphConsistencyError if operations are stuck without a stop request.
     */
    void finish_result(const std::vector<OperationTask>& tasks,
                       std::chrono::steady_clock::time_point start_time,
                       ExecutionResult& result) const;

    /**
     * @brief Deadline derived from `ExecutorConfig::timeout`, if any.
     */
    std::optional<std::chrono::steady_clock::time_point> deadline_from(
        std::chrono::steady_clock::time_point start_time) const;

    spdlog::logger& logger() const noexcept
    {
        return *m_config.logger;
    }

    ExecutorConfig m_config;
    CancellationToken m_cancellation;

private:
    void block_consumers(const OperationGraph& graph,
                         std::vector<OperationTask>& tasks,
                         OperationIdx failed,
                         ExecutionResult& result) const;

    void log_completion(const Operation& operation, const OperationRecord& record) const;
};

/**
 * @brief Concurrency limit to use for a command.
 *
 * @details
 * Global commands and phased commands without `enableParallelism` run one
 * operation at a time. Otherwise the configured parallelism applies, with 0
 * meaning the number of hardware threads.
 */
size_t effective_parallelism(const Command& command, const ExecutorConfig& config);

} // namespace phasegraph
