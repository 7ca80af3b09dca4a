/**
 * @file process_launcher.hpp
 * @brief Process spawning capability used by shell runners.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/cancellation_token.hpp"

namespace phasegraph
{

/**
 * @brief A shell command to run.
 */
struct ProcessRequest
{
    std::string command_line;
    std::string working_directory;
};

/**
 * @brief Outcome of a finished process.
 */
struct ProcessResult
{
    /// Exit status; 128 + signal number if the process was killed by a signal.
    int exit_code{0};
    std::string stdout_output;
    std::string stderr_output;

    /// True if termination was requested because of cancellation.
    bool cancelled{false};
};

/**
 * @brief Interface for running a shell command and waiting for it.
 *
 * @par Thread Safety
 * - `run()` may be called concurrently from several workers.
 */
class IProcessLauncher
{
public:
    virtual ~IProcessLauncher() = default;

    /**
     * @brief Run the command and wait for it to exit.
     *
     * @details
     * When `cancellation` is requested while the process runs, the launcher
     * asks the process to terminate and still waits for it to exit.
     *
     * @throw std::runtime_error if the process cannot be started.
     */
    virtual ProcessResult run(const ProcessRequest& request, const CancellationToken& cancellation) = 0;
};

using ProcessLauncherPtr = std::shared_ptr<IProcessLauncher>;

/**
 * @brief Runs commands through `/bin/sh -c` on POSIX systems.
 *
 * @details
 * The child runs in its own process group with stdout and stderr captured
 * through pipes. On cancellation the whole process group receives SIGTERM.
 */
class PosixProcessLauncher : public IProcessLauncher
{
public:
    /**
     * @param poll_interval How often to check the cancellation token while
     *        the process produces no output.
     */
    explicit PosixProcessLauncher(
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds{50});

    ProcessResult run(const ProcessRequest& request, const CancellationToken& cancellation) override;

private:
    std::chrono::milliseconds m_poll_interval;
};

} // namespace phasegraph
