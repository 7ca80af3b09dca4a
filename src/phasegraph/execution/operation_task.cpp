#include "phasegraph/execution/operation_task.hpp"
#include "phasegraph/common/errors.hpp"
#include "phasegraph/graph/operation_graph.hpp"

namespace phasegraph
{

OperationTask::OperationTask(const Operation& operation, OperationIdx idx)
    : m_operation{&operation}
    , m_idx{idx}
    , m_dependencies_remaining{operation.dependencies.size()}
{}

bool OperationTask::decrement_remaining_dependencies()
{
    if (m_dependencies_remaining == 0)
    {
        throw GraphConsistencyError("Operation \"" + m_operation->name +
                                    "\" was notified by more dependencies than it has");
    }
    --m_dependencies_remaining;
    return m_dependencies_remaining == 0;
}

void OperationTask::mark_queued()
{
    if (!is_ready())
    {
        throw GraphConsistencyError("Operation \"" + m_operation->name +
                                    "\" was queued before its dependencies finished");
    }
    transition(OperationStatus::Ready, OperationStatus::Queued);
}

void OperationTask::mark_executing()
{
    transition(OperationStatus::Queued, OperationStatus::Executing);
}

void OperationTask::complete(OperationStatus status, std::chrono::nanoseconds duration)
{
    if (!is_terminal(status))
    {
        throw GraphConsistencyError("Operation \"" + m_operation->name +
                                    "\" cannot complete with status " + to_string(status));
    }
    transition(OperationStatus::Executing, status);
    m_duration = duration;
}

void OperationTask::mark_blocked()
{
    transition(OperationStatus::Ready, OperationStatus::Blocked);
}

void OperationTask::transition(OperationStatus expected, OperationStatus desired)
{
    if (m_status != expected)
    {
        throw GraphConsistencyError("Operation \"" + m_operation->name + "\" cannot move from " +
                                    to_string(m_status) + " to " + to_string(desired));
    }
    m_status = desired;
}

} // namespace phasegraph
