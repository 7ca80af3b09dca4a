#include "phasegraph/execution/interrupt_watcher.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace phasegraph
{

namespace
{

int g_wake_pipe[2]{-1, -1};
std::atomic<bool> g_interrupted{false};
std::atomic<bool> g_watcher_active{false};

} // namespace

void InterruptWatcher::handle_signal(int)
{
    g_interrupted.store(true);
    char byte{};
    ssize_t ignored = ::write(g_wake_pipe[1], &byte, 1);
    (void)ignored;
}

InterruptWatcher::InterruptWatcher(std::function<void()> on_interrupt)
    : m_on_interrupt{std::move(on_interrupt)}
{
    if (g_watcher_active.exchange(true))
    {
        throw std::logic_error("InterruptWatcher: another watcher is already active");
    }
    if (::pipe2(g_wake_pipe, O_CLOEXEC) != 0)
    {
        g_watcher_active.store(false);
        throw std::runtime_error(std::string("InterruptWatcher: failed to create pipe: ") +
                                 std::strerror(errno));
    }
    g_interrupted.store(false);

    m_thread = std::thread(&InterruptWatcher::wait_for_signals, this);
    m_previous_handler = std::signal(SIGINT, &InterruptWatcher::handle_signal);
}

InterruptWatcher::~InterruptWatcher()
{
    std::signal(SIGINT, m_previous_handler == SIG_ERR ? SIG_DFL : m_previous_handler);

    // EOF on the read end stops the watcher thread.
    ::close(g_wake_pipe[1]);
    g_wake_pipe[1] = -1;
    m_thread.join();

    ::close(g_wake_pipe[0]);
    g_wake_pipe[0] = -1;
    g_watcher_active.store(false);
}

void InterruptWatcher::wait_for_signals()
{
    while (true)
    {
        char byte;
        ssize_t n = ::read(g_wake_pipe[0], &byte, 1);
        if (n == 0)
        {
            break;
        }
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }

        if (g_interrupted.exchange(false))
        {
            m_interrupt_count.fetch_add(1, std::memory_order_acq_rel);
            if (m_on_interrupt)
            {
                m_on_interrupt();
            }
        }
    }
}

} // namespace phasegraph
