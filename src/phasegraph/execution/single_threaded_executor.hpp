/**
 * @file single_threaded_executor.hpp
 * @brief SingleThreadedExecutor for sequential operation execution.
 */
#pragma once
#include "phasegraph/execution/executor.hpp"

namespace phasegraph
{

/**
 * @brief Runs operations one at a time on the calling thread.
 *
 * @details
 * Reference implementation for the parallel executor, and the executor of
 * choice for commands that do not enable parallelism. Ready operations run in
 * FIFO order.
 *
 * @par Thread Safety
 * - execute() is not thread-safe; call from one thread only.
 * - request_stop() can be called from any thread, including from a runner.
 */
class SingleThreadedExecutor : public Executor
{
public:
    /**
     * @param config Configuration (parallelism ignored, always 1).
     */
    explicit SingleThreadedExecutor(ExecutorConfig config = {});

    ExecutionResult execute(OperationGraphPtr graph) override;
};

inline std::shared_ptr<SingleThreadedExecutor> make_single_threaded_executor(ExecutorConfig config = {})
{
    return std::make_shared<SingleThreadedExecutor>(std::move(config));
}

} // namespace phasegraph
