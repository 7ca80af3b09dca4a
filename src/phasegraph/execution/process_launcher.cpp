#include "phasegraph/execution/process_launcher.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace phasegraph
{

namespace
{

std::runtime_error system_failure(const std::string& what)
{
    return std::runtime_error(what + ": " + std::strerror(errno));
}

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

PosixProcessLauncher::PosixProcessLauncher(std::chrono::milliseconds poll_interval)
    : m_poll_interval{poll_interval}
{}

ProcessResult PosixProcessLauncher::run(const ProcessRequest& request,
                                        const CancellationToken& cancellation)
{
    int stdout_pipe[2];
    int stderr_pipe[2];

    // Close-on-exec: children forked concurrently by other workers must not
    // inherit these ends. dup2 clears the flag on the child's stdout/stderr.
    if (::pipe2(stdout_pipe, O_CLOEXEC) != 0)
    {
        throw system_failure("Failed to create stdout pipe");
    }
    if (::pipe2(stderr_pipe, O_CLOEXEC) != 0)
    {
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        throw system_failure("Failed to create stderr pipe");
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]);
        ::close(stderr_pipe[1]);
        throw system_failure("Failed to fork process");
    }

    if (pid == 0)
    {
        // Child: own process group so that cancellation reaches grandchildren.
        ::setpgid(0, 0);

        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[0]);
        ::close(stderr_pipe[1]);

        if (!request.working_directory.empty() && ::chdir(request.working_directory.c_str()) != 0)
        {
            const char* message = "Failed to enter the working directory\n";
            ssize_t ignored = ::write(STDERR_FILENO, message, std::strlen(message));
            (void)ignored;
            ::_exit(127);
        }

        ::execl("/bin/sh", "sh", "-c", request.command_line.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Parent. Also set the group here so an early cancellation cannot miss it.
    ::setpgid(pid, pid);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);

    ProcessResult result;
    std::array<pollfd, 2> fds{{{stdout_pipe[0], POLLIN, 0}, {stderr_pipe[0], POLLIN, 0}}};
    std::array<std::string*, 2> sinks{{&result.stdout_output, &result.stderr_output}};
    size_t open_count = fds.size();
    std::array<char, 4096> buffer;

    while (open_count > 0)
    {
        if (!result.cancelled && cancellation.is_cancellation_requested())
        {
            ::kill(-pid, SIGTERM);
            result.cancelled = true;
        }

        int ready = ::poll(fds.data(), fds.size(), static_cast<int>(m_poll_interval.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }

        for (size_t i = 0; i < fds.size(); ++i)
        {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            {
                continue;
            }

            ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0)
            {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            }
            else if (n == 0 || (errno != EINTR && errno != EAGAIN))
            {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_count;
            }
        }
    }

    for (auto& fd : fds)
    {
        if (fd.fd >= 0)
        {
            ::close(fd.fd);
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            throw system_failure("Failed to wait for child process");
        }
    }

    result.exit_code = decode_wait_status(status);
    return result;
}

} // namespace phasegraph
