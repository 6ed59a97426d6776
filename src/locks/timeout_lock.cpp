#include "locks/timeout_lock.hpp"

#include <utility>

namespace locklab::locks
{

namespace
{
using Clock = std::chrono::steady_clock;

// Advances `pred` past an abandoned node. Returns true once `pred` has been released by a
// holder, false if it is still pending.
bool poll_predecessor(sync::Waiter<TimeoutLink> &pred) noexcept
{
    for (;;)
    {
        TimeoutLink *link = pred.try_wait();
        if (link == nullptr)
        {
            return false;
        }
        if (!link->rest)
        {
            return true;
        }
        sync::Waiter<TimeoutLink> next = std::move(link->rest);
        pred = std::move(next); // frees the abandoned node
    }
}
} // namespace

TimeoutLock::TimeoutLock() : tail_(sync::make_notified_waiter<TimeoutLink>())
{
    LOGGER_TRACE("TimeoutLock created");
}

TimeoutLock::Guard TimeoutLock::acquire()
{
    auto [mine, handoff] = sync::make_handshake<TimeoutLink>();
    sync::Waiter<TimeoutLink> pred = tail_.swap(std::move(mine), std::memory_order_acq_rel);
    while (!poll_predecessor(pred))
    {
        platform::cpu_relax();
    }
    return Guard(std::move(handoff));
}

std::optional<TimeoutLock::Guard> TimeoutLock::try_acquire(std::chrono::nanoseconds timeout)
{
    const auto start = Clock::now();
    // Saturate so that nanoseconds::max() means "no deadline" instead of overflowing.
    const auto deadline = timeout >= Clock::time_point::max() - start
                              ? Clock::time_point::max()
                              : start + std::chrono::duration_cast<Clock::duration>(timeout);

    auto [mine, handoff] = sync::make_handshake<TimeoutLink>();
    sync::Waiter<TimeoutLink> pred = tail_.swap(std::move(mine), std::memory_order_acq_rel);
    while (!poll_predecessor(pred))
    {
        if (Clock::now() >= deadline)
        {
            // Leave the queue: our successor inherits what we were waiting on.
            handoff->rest = std::move(pred);
            handoff.notify();
            LOGGER_DEBUG("TimeoutLock: try_acquire gave up after {}us",
                         std::chrono::duration_cast<std::chrono::microseconds>(
                             Clock::now() - start)
                             .count());
            return std::nullopt;
        }
        platform::cpu_relax();
    }
    return Guard(std::move(handoff));
}

} // namespace locklab::locks
