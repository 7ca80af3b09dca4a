/**
 * @file operation_status.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"

namespace phasegraph
{

/**
 * @brief Execution state of an operation.
 *
 * @details
 * State transitions:
 * - Ready -> Queued (all dependencies reached a non-blocking terminal state)
 * - Queued -> Executing (a worker picked it up)
 * - Executing -> Success | SuccessWithWarning | Failure | Skipped | NoOp | FromCache
 * - Ready -> Blocked (a dependency ended in Failure or Blocked)
 *
 * Terminal states: Success, SuccessWithWarning, Failure, Blocked, Skipped,
 * NoOp, FromCache. No operation leaves a terminal state. An operation that
 * was never dispatched because execution was cancelled stays in Ready or
 * Queued.
 */
enum class OperationStatus
{
    Ready,
    Queued,
    Executing,
    Success,
    SuccessWithWarning,
    Failure,
    Blocked,
    Skipped,
    NoOp,
    FromCache
};

inline bool is_terminal(OperationStatus status) noexcept
{
    switch (status)
    {
    case OperationStatus::Ready:
    case OperationStatus::Queued:
    case OperationStatus::Executing:
        return false;
    default:
        return true;
    }
}

/**
 * @brief True for terminal states that prevent consumers from running.
 */
inline bool blocks_consumers(OperationStatus status) noexcept
{
    return status == OperationStatus::Failure || status == OperationStatus::Blocked;
}

/**
 * @brief True for terminal states after which consumers may run.
 */
inline bool satisfies_consumers(OperationStatus status) noexcept
{
    return is_terminal(status) && !blocks_consumers(status);
}

inline const char* to_string(OperationStatus status) noexcept
{
    switch (status)
    {
    case OperationStatus::Ready:
        return "READY";
    case OperationStatus::Queued:
        return "QUEUED";
    case OperationStatus::Executing:
        return "EXECUTING";
    case OperationStatus::Success:
        return "SUCCESS";
    case OperationStatus::SuccessWithWarning:
        return "SUCCESS WITH WARNINGS";
    case OperationStatus::Failure:
        return "FAILURE";
    case OperationStatus::Blocked:
        return "BLOCKED";
    case OperationStatus::Skipped:
        return "SKIPPED";
    case OperationStatus::NoOp:
        return "NO OP";
    case OperationStatus::FromCache:
        return "FROM CACHE";
    }
    return "UNKNOWN";
}

} // namespace phasegraph
