/**
 * @file cancellation_token.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"

namespace phasegraph
{

/**
 * @brief Shared, copyable view of a stop flag.
 *
 * @details
 * An executor owns the flag and hands copies of the token to every runner it
 * dispatches. Runners poll `is_cancellation_requested()` while they wait on
 * external work (a spawned process, a cache fetch) and wind down early once
 * the flag is set. Setting the flag is sticky: it cannot be cleared.
 *
 * A default-constructed token owns a fresh flag of its own.
 *
 * @par Thread Safety
 * - All member functions may be called concurrently from any thread.
 */
class CancellationToken
{
public:
    CancellationToken()
        : m_flag{std::make_shared<std::atomic<bool>>(false)}
    {}

    void request_cancellation() noexcept
    {
        m_flag->store(true, std::memory_order_release);
    }

    bool is_cancellation_requested() const noexcept
    {
        return m_flag->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace phasegraph
