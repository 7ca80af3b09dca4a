#include "phasegraph/execution/parallel_executor.hpp"
#include "phasegraph/execution/single_threaded_executor.hpp"
#include <deque>
#include <thread>

namespace phasegraph
{

ParallelExecutor::ParallelExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{
    m_parallelism = m_config.parallelism > 0
                        ? m_config.parallelism
                        : std::max<size_t>(1, std::thread::hardware_concurrency());
}

void ParallelExecutor::on_stop_requested()
{
    std::lock_guard<std::mutex> lock(m_wake_mutex);
    if (m_active_completions)
    {
        Completion wake;
        wake.wake = true;
        m_active_completions->push(std::move(wake));
    }
}

ExecutionResult ParallelExecutor::execute(OperationGraphPtr graph)
{
    if (!graph)
    {
        throw std::invalid_argument("ParallelExecutor::execute: graph is null");
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

    auto dispatch = std::make_shared<Channel<Dispatch>>();
    auto completions = std::make_shared<Channel<Completion>>();
    {
        std::lock_guard<std::mutex> lock(m_wake_mutex);
        m_active_completions = completions;
    }

    size_t worker_count = std::min(m_parallelism, std::max<size_t>(1, graph->operation_count()));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i)
    {
        workers.emplace_back([this, graph, dispatch, completions] {
            while (auto work = dispatch->pop())
            {
                auto op_start = std::chrono::steady_clock::now();
                Completion completion;
                completion.idx = work->idx;
                completion.run = invoke_runner(graph->operations[work->idx], work->skip_allowed);
                completion.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
                    std::chrono::steady_clock::now() - op_start);
                completions->push(std::move(completion));
            }
        });
    }

    // Joins the workers on every exit path, including exceptions.
    auto shutdown = [&] {
        dispatch->close();
        for (auto& worker : workers)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        std::lock_guard<std::mutex> lock(m_wake_mutex);
        m_active_completions.reset();
    };

    try
    {
        size_t in_flight = 0;
        while (true)
        {
            while (!stop_requested() && in_flight < m_parallelism && !ready_queue.empty())
            {
                OperationIdx idx = ready_queue.front();
                ready_queue.pop_front();
                tasks[idx].mark_executing();
                logger().debug("Starting {}", graph->operations[idx].name);
                dispatch->push(Dispatch{idx, tasks[idx].skip_allowed()});
                ++in_flight;
            }

            if (in_flight == 0)
            {
                break;
            }

            std::optional<Completion> completion =
                deadline ? completions->pop_until(*deadline) : completions->pop();

            if (!completion)
            {
                logger().error("Timed out after {} ms, waiting for {} running operations",
                               m_config.timeout->count(),
                               in_flight);
                result.timed_out = true;
                deadline.reset();
                request_stop();
                continue;
            }

            if (completion->wake)
            {
                continue;
            }

            --in_flight;
            for (OperationIdx next : complete_operation(
                     *graph, tasks, completion->idx, std::move(completion->run), completion->duration, result))
            {
                tasks[next].mark_queued();
                ready_queue.push_back(next);
            }
        }
    }
    catch (...)
    {
        request_stop();
        shutdown();
        throw;
    }
    shutdown();

    finish_result(tasks, start_time, result);
    return result;
}

ExecutorPtr make_executor_for(const Command& command, ExecutorConfig config)
{
    size_t parallelism = effective_parallelism(command, config);
    config.parallelism = parallelism;
    if (parallelism == 1)
    {
        return make_single_threaded_executor(std::move(config));
    }
    return make_parallel_executor(std::move(config));
}

} // namespace phasegraph
