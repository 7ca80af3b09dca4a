/**
 * @file execution_result.hpp
 * @brief Definition of ExecutionResult returned by IExecutor::execute().
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/config_enums.hpp"
#include "phasegraph/execution/operation_status.hpp"

namespace phasegraph
{

/**
 * @brief Aggregate outcome of one command invocation.
 */
enum class ExecutionVerdict
{
    Success,
    Failure,
    Cancelled
};

inline const char* to_string(ExecutionVerdict verdict) noexcept
{
    switch (verdict)
    {
    case ExecutionVerdict::Success:
        return "SUCCESS";
    case ExecutionVerdict::Failure:
        return "FAILURE";
    case ExecutionVerdict::Cancelled:
        return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Process exit code for a verdict: 0, 1, or 130 (interrupted).
 */
inline int exit_code_for(ExecutionVerdict verdict) noexcept
{
    switch (verdict)
    {
    case ExecutionVerdict::Success:
        return 0;
    case ExecutionVerdict::Failure:
        return 1;
    case ExecutionVerdict::Cancelled:
        return 130;
    }
    return 1;
}

/**
 * @brief One operation reaching a terminal state.
 */
struct OperationRecord
{
    OperationIdx operation{0};
    std::string name;
    OperationStatus status{OperationStatus::Success};

    /// Runner wall-clock time; zero for Blocked operations.
    std::chrono::nanoseconds duration{0};

    std::string output;
};

/**
 * @brief Result of executing an operation graph.
 *
 * @details
 * - `records` lists operations in the order they reached a terminal state.
 *   Blocked operations are recorded at the moment they became blocked.
 * - `final_statuses` is indexed by `OperationIdx`.
 * - `not_started` lists operations that stayed Ready or Queued because the
 *   run was stopped (cancellation or timeout).
 */
struct ExecutionResult
{
    ExecutionVerdict verdict{ExecutionVerdict::Success};

    std::vector<OperationRecord> records;

    std::vector<OperationStatus> final_statuses;

    std::vector<OperationIdx> not_started;

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /// True if dispatching was stopped by request or timeout.
    bool stopped{false};

    bool timed_out{false};

    bool success() const noexcept
    {
        return verdict == ExecutionVerdict::Success;
    }

    /**
     * @brief Number of operations whose final status is `status`.
     */
    size_t count(OperationStatus status) const
    {
        return static_cast<size_t>(std::count(final_statuses.begin(), final_statuses.end(), status));
    }

    /**
     * @brief Find the record for an operation, if it reached a terminal state.
     */
    const OperationRecord* find_record(OperationIdx operation) const
    {
        for (const auto& record : records)
        {
            if (record.operation == operation)
            {
                return &record;
            }
        }
        return nullptr;
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result;
        switch (verdict)
        {
        case ExecutionVerdict::Success:
            result = "Execution succeeded";
            break;
        case ExecutionVerdict::Failure:
            result = "Execution failed";
            break;
        case ExecutionVerdict::Cancelled:
            result = timed_out ? "Execution timed out" : "Execution stopped by request";
            break;
        }

        result += " (operations=" + std::to_string(final_statuses.size());
        for (OperationStatus status : {OperationStatus::Success,
                                       OperationStatus::SuccessWithWarning,
                                       OperationStatus::Skipped,
                                       OperationStatus::FromCache,
                                       OperationStatus::NoOp,
                                       OperationStatus::Failure,
                                       OperationStatus::Blocked})
        {
            size_t n = count(status);
            if (n > 0)
            {
                result += ", ";
                result += to_string(status);
                result += "=" + std::to_string(n);
            }
        }
        if (!not_started.empty())
        {
            result += ", NOT STARTED=" + std::to_string(not_started.size());
        }
        result += ")";
        return result;
    }
};

} // namespace phasegraph
