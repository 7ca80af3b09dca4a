#include "phasegraph/execution/null_operation_runner.hpp"

namespace phasegraph
{

NullOperationRunner::NullOperationRunner(std::string name, OperationStatus result, bool silent)
    : m_name{std::move(name)}
    , m_result{result}
    , m_silent{silent}
{
    if (!is_terminal(result) || result == OperationStatus::Blocked)
    {
        throw std::invalid_argument("NullOperationRunner: \"" + m_name +
                                    "\" must report a terminal, non-blocked status");
    }
}

OperationRunResult NullOperationRunner::execute(const OperationRunnerContext& /*context*/)
{
    return OperationRunResult{m_result, {}};
}

} // namespace phasegraph
