/**
 * @file operation_task.hpp
 * @brief OperationTask: per-run scheduling state of one operation.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/config_enums.hpp"
#include "phasegraph/execution/operation_status.hpp"

namespace phasegraph
{

struct Operation;

/**
 * @brief Tracks the status of one operation during a single run.
 *
 * @details
 * The state machine is:
 * - Ready: waiting for dependencies (initial state).
 * - Queued: every dependency finished with a non-blocking status.
 * - Executing: handed to a worker.
 * - Terminal: set by `complete()` (runner outcome) or `mark_blocked()`.
 *
 * Illegal transitions throw `GraphConsistencyError`.
 *
 * @par Thread Safety
 * - Not thread-safe. Only the executor's coordinating thread touches tasks;
 *   workers report back through a channel instead.
 */
class OperationTask
{
public:
    OperationTask(const Operation& operation, OperationIdx idx);

    OperationStatus status() const noexcept
    {
        return m_status;
    }

    bool is_ready() const noexcept
    {
        return m_dependencies_remaining == 0;
    }

    /**
     * @brief Account for one dependency reaching a non-blocking status.
     * @return True if this call made the task ready.
     */
    bool decrement_remaining_dependencies();

    void mark_queued();
    void mark_executing();

    /**
     * @brief Record the runner's outcome.
     * @pre Executing, and `status` is terminal.
     */
    void complete(OperationStatus status, std::chrono::nanoseconds duration);

    /**
     * @brief A dependency failed or was blocked.
     * @pre Ready.
     */
    void mark_blocked();

    std::chrono::nanoseconds duration() const noexcept
    {
        return m_duration;
    }

    const Operation& operation() const noexcept
    {
        return *m_operation;
    }

    OperationIdx idx() const noexcept
    {
        return m_idx;
    }

    /**
     * @brief Whether the runner may reuse previous results (skip or cache restore).
     * @details Cleared once any dependency actually executed in this run.
     */
    bool skip_allowed() const noexcept
    {
        return m_skip_allowed;
    }

    void disallow_skip() noexcept
    {
        m_skip_allowed = false;
    }

private:
    void transition(OperationStatus expected, OperationStatus desired);

    const Operation* m_operation;
    OperationIdx m_idx;
    OperationStatus m_status{OperationStatus::Ready};
    size_t m_dependencies_remaining;
    std::chrono::nanoseconds m_duration{0};
    bool m_skip_allowed{true};
};

} // namespace phasegraph
