/**
 * @file null_operation_runner.hpp
 */
#pragma once
#include "phasegraph/execution/operation_runner.hpp"

namespace phasegraph
{

/**
 * @brief Runner for operations that require no work, such as a missing or
 *        empty script.
 *
 * @details
 * Returns a fixed status without spawning anything.
 */
class NullOperationRunner : public IOperationRunner
{
public:
    /**
     * @param name The name to report in logs.
     * @param result The status to report.
     * @param silent If true, the operation is not logged individually.
     */
    NullOperationRunner(std::string name, OperationStatus result, bool silent);

    const std::string& name() const override
    {
        return m_name;
    }

    bool silent() const noexcept override
    {
        return m_silent;
    }

    OperationStatus result() const noexcept
    {
        return m_result;
    }

    OperationRunResult execute(const OperationRunnerContext& context) override;

private:
    std::string m_name;
    OperationStatus m_result;
    bool m_silent;
};

} // namespace phasegraph
