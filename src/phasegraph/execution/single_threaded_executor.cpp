#include "phasegraph/execution/single_threaded_executor.hpp"
#include <deque>

namespace phasegraph
{

SingleThreadedExecutor::SingleThreadedExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{}

ExecutionResult SingleThreadedExecutor::execute(OperationGraphPtr graph)
{
    if (!graph)
    {
        throw std::invalid_argument("SingleThreadedExecutor::execute: graph is null");
    }

    ExecutionResult result;
    auto start_time = std::chrono::steady_clock::now();
    auto deadline = deadline_from(start_time);

    std::vector<OperationTask> tasks = create_tasks(*graph);
    std::deque<OperationIdx> ready_queue;

    for (OperationIdx idx : graph->get_initial_ready_operations())
    {
        tasks[idx].mark_queued();
        ready_queue.push_back(idx);
    }

    while (!ready_queue.empty() && !stop_requested())
    {
        if (deadline && std::chrono::steady_clock::now() >= *deadline)
        {
            logger().error("Timed out after {} ms", m_config.timeout->count());
            result.timed_out = true;
            request_stop();
            break;
        }

        OperationIdx idx = ready_queue.front();
        ready_queue.pop_front();

        tasks[idx].mark_executing();
        logger().debug("Starting {}", graph->operations[idx].name);
        auto op_start = std::chrono::steady_clock::now();
        OperationRunResult run = invoke_runner(graph->operations[idx], tasks[idx].skip_allowed());
        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - op_start);

        for (OperationIdx next : complete_operation(*graph, tasks, idx, std::move(run), duration, result))
        {
            tasks[next].mark_queued();
            ready_queue.push_back(next);
        }
    }

    finish_result(tasks, start_time, result);
    return result;
}

} // namespace phasegraph
