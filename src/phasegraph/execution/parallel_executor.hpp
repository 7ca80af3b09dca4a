/**
 * @file parallel_executor.hpp
 * @brief ParallelExecutor: coordinator thread plus a bounded worker pool.
 */
#pragma once
#include "phasegraph/execution/channel.hpp"
#include "phasegraph/execution/executor.hpp"
#include <mutex>

namespace phasegraph
{

/**
 * @brief Executes up to `parallelism` operations at once.
 *
 * @details
 * The thread calling `execute()` acts as coordinator and is the only one that
 * changes operation status. Workers pop operation indices from a dispatch
 * channel, call the runner and push the outcome onto a completion channel.
 * The coordinator applies each completion, which may release consumers, and
 * dispatches more work while fewer than `parallelism` operations are in flight.
 *
 * On stop (request or timeout) nothing new is dispatched, in-flight
 * operations are drained, and the workers are joined before returning.
 *
 * @par Thread Safety
 * - execute() is not thread-safe; call from one thread only.
 * - request_stop() can be called from any thread.
 */
class ParallelExecutor : public Executor
{
public:
    explicit ParallelExecutor(ExecutorConfig config = {});

    ExecutionResult execute(OperationGraphPtr graph) override;

    /**
     * @brief The concurrency limit in effect (never 0).
     */
    size_t parallelism() const noexcept
    {
        return m_parallelism;
    }

protected:
    void on_stop_requested() override;

private:
    /// Work handed to a worker. Tasks stay on the coordinator, so the skip
    /// decision travels with the index.
    struct Dispatch
    {
        OperationIdx idx{0};
        bool skip_allowed{true};
    };

    struct Completion
    {
        OperationIdx idx{0};
        OperationRunResult run;
        std::chrono::nanoseconds duration{0};

        /// No operation attached; only wakes the coordinator.
        bool wake{false};
    };

    size_t m_parallelism;

    std::mutex m_wake_mutex;
    std::shared_ptr<Channel<Completion>> m_active_completions;
};

inline std::shared_ptr<ParallelExecutor> make_parallel_executor(ExecutorConfig config = {})
{
    return std::make_shared<ParallelExecutor>(std::move(config));
}

/**
 * @brief Pick the executor matching the command's parallelism.
 */
ExecutorPtr make_executor_for(const Command& command, ExecutorConfig config);

} // namespace phasegraph
