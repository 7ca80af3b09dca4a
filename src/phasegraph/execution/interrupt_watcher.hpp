/**
 * @file interrupt_watcher.hpp
 * @brief Turns SIGINT into a callback on a dedicated thread.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include <thread>

namespace phasegraph
{

/**
 * @brief Installs a SIGINT handler for its lifetime.
 *
 * @details
 * The signal handler only sets a flag and writes a byte to a pipe. A
 * dedicated thread reads the pipe and calls `on_interrupt` outside of signal
 * context, where it may take locks (e.g. `IExecutor::request_stop()`).
 *
 * Only one watcher may exist at a time. The previous SIGINT disposition is
 * restored on destruction.
 *
 * @par Thread Safety
 * - `on_interrupt` runs on the watcher thread.
 */
class InterruptWatcher
{
public:
    /**
     * @throw std::logic_error if another watcher is active.
     * @throw std::runtime_error if the wake pipe cannot be created.
     */
    explicit InterruptWatcher(std::function<void()> on_interrupt);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    /**
     * @brief Number of interrupts handled so far.
     */
    size_t interrupt_count() const noexcept
    {
        return m_interrupt_count.load(std::memory_order_acquire);
    }

private:
    static void handle_signal(int);
    void wait_for_signals();

    std::function<void()> m_on_interrupt;
    void (*m_previous_handler)(int){nullptr};
    std::atomic<size_t> m_interrupt_count{0};
    std::thread m_thread;
};

} // namespace phasegraph
