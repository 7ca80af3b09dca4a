/**
 * @file errors.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"

namespace phasegraph
{

/**
 * @brief Error codes for configuration failures.
 *
 * @details
 * Every code corresponds to a fatal, user-correctable mistake in the resolved
 * command line configuration or in the project scripts it refers to. The
 * process must not proceed to scheduling once one of these is raised.
 */
enum class ConfigurationErrorCode
{
    DuplicatePhaseName,
    InvalidPhaseName,
    MissingPhase,
    PhaseCycleDetected,
    DuplicateCommandName,
    InvalidBuildCommandKind,
    UnsafeBuildCommand,
    MissingBuildPhases,
    MissingCommand,
    WrongCommandKind,
    ParameterWithoutCommand,
    ParameterWithoutPhase,
    InvalidChoiceDefault,
    MissingScript
};

/**
 * @brief Exception class for configuration errors.
 *
 * @details
 * `ConfigurationError` is thrown while phases, commands and parameters are
 * loaded and cross-referenced, and when an operation needs a project script
 * that does not exist. The message names the offending entity.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class ConfigurationError : public std::exception
{
public:
    /**
     * @brief Construct a ConfigurationError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message naming the offending entity.
     */
    ConfigurationError(ConfigurationErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    ConfigurationErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ConfigurationErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when the operation graph or the scheduler finds an
 *        internal inconsistency.
 *
 * @details
 * Validated input never produces these. A `GraphConsistencyError` is a defect
 * (a dangling index, a dependency cycle that slipped through, a scheduler
 * stall), not something a user can correct in configuration.
 */
class GraphConsistencyError : public std::logic_error
{
public:
    explicit GraphConsistencyError(const std::string& msg)
        : std::logic_error(msg)
    {}
};

} // namespace phasegraph
