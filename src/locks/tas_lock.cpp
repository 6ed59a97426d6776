#include "locks/tas_lock.hpp"

namespace locklab::locks
{

TasLock::TasLock()
{
    LOGGER_TRACE("TasLock created");
}

TasLock::Guard TasLock::acquire()
{
    while (locked_.exchange(true, std::memory_order_acquire))
    {
        platform::cpu_relax();
    }
    return Guard(locked_, false, std::memory_order_release);
}

} // namespace locklab::locks
