#include "locks/ttas_lock.hpp"

namespace locklab::locks
{

namespace
{
void spin_while_locked(const std::atomic<bool> &locked) noexcept
{
    while (locked.load(std::memory_order_relaxed))
    {
        platform::cpu_relax();
    }
}
} // namespace

TtasLock::TtasLock()
{
    LOGGER_TRACE("TtasLock created");
}

TtasLock::Guard TtasLock::acquire()
{
    for (;;)
    {
        spin_while_locked(locked_);
        if (!locked_.exchange(true, std::memory_order_acquire))
        {
            return Guard(locked_, false, std::memory_order_release);
        }
    }
}

std::optional<TtasLock::Guard> TtasLock::try_acquire()
{
    spin_while_locked(locked_);
    if (locked_.exchange(true, std::memory_order_acquire))
    {
        return std::nullopt;
    }
    return Guard(locked_, false, std::memory_order_release);
}

BackoffLock::BackoffLock(utils::BackoffConfig config) : config_(config)
{
    LOGGER_TRACE("BackoffLock created, delay bounds {}ns..{}ns", config_.min_delay.count(),
                 config_.max_delay.count());
}

BackoffLock::Guard BackoffLock::acquire()
{
    utils::Backoff backoff(config_);
    for (;;)
    {
        spin_while_locked(locked_);
        if (!locked_.exchange(true, std::memory_order_acquire))
        {
            return Guard(locked_, false, std::memory_order_release);
        }
        backoff.backoff();
    }
}

} // namespace locklab::locks
