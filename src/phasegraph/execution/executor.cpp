#include "phasegraph/execution/executor.hpp"
#include "phasegraph/common/errors.hpp"
#include <deque>
#include <thread>

namespace phasegraph
{

Executor::Executor(ExecutorConfig config)
    : m_config{std::move(config)}
{
    if (!m_config.logger)
    {
        m_config.logger = make_null_logger();
    }
}

void Executor::request_stop()
{
    m_cancellation.request_cancellation();
    on_stop_requested();
}

bool Executor::stop_requested() const noexcept
{
    return m_cancellation.is_cancellation_requested();
}

std::vector<OperationTask> Executor::create_tasks(const OperationGraph& graph) const
{
    std::vector<OperationTask> tasks;
    tasks.reserve(graph.operation_count());
    for (OperationIdx idx = 0; idx < graph.operation_count(); ++idx)
    {
        tasks.emplace_back(graph.operations[idx], idx);
    }
    return tasks;
}

OperationRunResult Executor::invoke_runner(const Operation& operation, bool skip_allowed) const
{
    if (!operation.runner)
    {
        return OperationRunResult{OperationStatus::Failure, "Operation has no runner"};
    }

    OperationRunnerContext context{operation, m_cancellation, m_config.logger, skip_allowed};
    OperationRunResult run;
    try
    {
        run = operation.runner->execute(context);
    }
    catch (const std::exception& e)
    {
        return OperationRunResult{OperationStatus::Failure, e.what()};
    }
    catch (...)
    {
        return OperationRunResult{OperationStatus::Failure, "Unknown exception"};
    }

    if (!is_terminal(run.status))
    {
        return OperationRunResult{OperationStatus::Failure,
                                  std::string("Runner reported non-terminal status ") +
                                      to_string(run.status)};
    }
    return run;
}

std::vector<OperationIdx> Executor::complete_operation(const OperationGraph& graph,
                                                       std::vector<OperationTask>& tasks,
                                                       OperationIdx idx,
                                                       OperationRunResult run,
                                                       std::chrono::nanoseconds duration,
                                                       ExecutionResult& result) const
{
    OperationTask& task = tasks.at(idx);
    task.complete(run.status, duration);

    const Operation& operation = graph.operations[idx];
    result.records.push_back(
        OperationRecord{idx, operation.name, run.status, duration, std::move(run.output)});
    log_completion(operation, result.records.back());

    std::vector<OperationIdx> newly_ready;
    if (blocks_consumers(task.status()))
    {
        block_consumers(graph, tasks, idx, result);
        return newly_ready;
    }

    // Skipped, NoOp and FromCache leave consumers free to reuse their results.
    bool executed = task.status() == OperationStatus::Success ||
                    task.status() == OperationStatus::SuccessWithWarning;

    for (OperationIdx consumer : operation.consumers)
    {
        OperationTask& consumer_task = tasks[consumer];
        // Already blocked by another dependency.
        if (consumer_task.status() != OperationStatus::Ready)
        {
            continue;
        }
        if (executed)
        {
            consumer_task.disallow_skip();
        }
        if (consumer_task.decrement_remaining_dependencies())
        {
            newly_ready.push_back(consumer);
        }
    }
    return newly_ready;
}

void Executor::block_consumers(const OperationGraph& graph,
                               std::vector<OperationTask>& tasks,
                               OperationIdx failed,
                               ExecutionResult& result) const
{
    std::deque<OperationIdx> pending(graph.operations[failed].consumers.begin(),
                                     graph.operations[failed].consumers.end());
    while (!pending.empty())
    {
        OperationIdx idx = pending.front();
        pending.pop_front();

        OperationTask& task = tasks[idx];
        if (task.status() != OperationStatus::Ready)
        {
            continue;
        }
        task.mark_blocked();

        const Operation& operation = graph.operations[idx];
        result.records.push_back(
            OperationRecord{idx, operation.name, OperationStatus::Blocked, std::chrono::nanoseconds{0}, {}});
        log_completion(operation, result.records.back());

        pending.insert(pending.end(), operation.consumers.begin(), operation.consumers.end());
    }
}

void Executor::log_completion(const Operation& operation, const OperationRecord& record) const
{
    spdlog::logger& log = logger();
    double seconds = std::chrono::duration<double>(record.duration).count();

    switch (record.status)
    {
    case OperationStatus::Failure:
        log.error("{} ({}) {:.2f}s", operation.name, to_string(record.status), seconds);
        if (!record.output.empty())
        {
            log.error("{}", record.output);
        }
        break;
    case OperationStatus::SuccessWithWarning:
        log.warn("{} ({}) {:.2f}s", operation.name, to_string(record.status), seconds);
        if (!record.output.empty())
        {
            log.warn("{}", record.output);
        }
        break;
    case OperationStatus::Blocked:
        log.warn("{} ({}) a dependency did not succeed", operation.name, to_string(record.status));
        break;
    default:
        if (operation.runner && operation.runner->silent())
        {
            log.debug("{} ({})", operation.name, to_string(record.status));
        }
        else
        {
            log.info("{} ({}) {:.2f}s", operation.name, to_string(record.status), seconds);
        }
        break;
    }
}

void Executor::finish_result(const std::vector<OperationTask>& tasks,
                             std::chrono::steady_clock::time_point start_time,
                             ExecutionResult& result) const
{
    result.stopped = stop_requested();
    result.final_statuses.clear();
    result.not_started.clear();

    bool any_failure = false;
    for (const auto& task : tasks)
    {
        OperationStatus status = task.status();
        result.final_statuses.push_back(status);

        switch (status)
        {
        case OperationStatus::Ready:
        case OperationStatus::Queued:
            result.not_started.push_back(task.idx());
            break;
        case OperationStatus::Executing:
            throw GraphConsistencyError("Operation \"" + task.operation().name +
                                        "\" was still executing when the run ended");
        case OperationStatus::Failure:
            any_failure = true;
            break;
        default:
            break;
        }
    }

    if (!result.stopped && !result.not_started.empty())
    {
        throw GraphConsistencyError(
            "Execution stalled with " + std::to_string(result.not_started.size()) +
            " operations waiting on dependencies that never finished; the graph has a cycle");
    }

    if (result.stopped && (any_failure || !result.not_started.empty() ||
                           result.count(OperationStatus::Blocked) > 0))
    {
        result.verdict = ExecutionVerdict::Cancelled;
    }
    else if (any_failure)
    {
        result.verdict = ExecutionVerdict::Failure;
    }
    else
    {
        result.verdict = ExecutionVerdict::Success;
    }

    result.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);

    spdlog::logger& log = logger();
    if (result.success())
    {
        log.info("{}", result.summary());
    }
    else
    {
        log.error("{}", result.summary());
    }
}

std::optional<std::chrono::steady_clock::time_point> Executor::deadline_from(
    std::chrono::steady_clock::time_point start_time) const
{
    if (!m_config.timeout)
    {
        return std::nullopt;
    }
    return start_time + *m_config.timeout;
}

size_t effective_parallelism(const Command& command, const ExecutorConfig& config)
{
    if (const auto* phased = std::get_if<PhasedCommand>(&command))
    {
        if (!phased->enable_parallelism)
        {
            return 1;
        }
        if (config.parallelism > 0)
        {
            return config.parallelism;
        }
        return std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return 1;
}

} // namespace phasegraph
