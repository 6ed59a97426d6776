#include "locks/peterson_lock.hpp"
#include "utils/debug_info.hpp"

namespace locklab::locks
{

PetersonLock::PetersonLock(std::size_t capacity) : BoundedLockBase("PetersonLock", capacity)
{
    if (capacity > kMaxParticipants)
    {
        LOCKLAB_PANIC("PetersonLock supports at most {} participants, {} requested",
                      kMaxParticipants, capacity);
    }
    LOGGER_DEBUG("PetersonLock created for {} participants", capacity);
}

PetersonLock::Guard PetersonLock::acquire_as(std::size_t id)
{
    const std::size_t other = 1 - id;
    flags_[id].store(true, std::memory_order_relaxed);
    victim_.exchange(id, std::memory_order_acq_rel);
    while (flags_[other].load(std::memory_order_acquire) &&
           victim_.load(std::memory_order_acquire) == id)
    {
        platform::cpu_relax();
    }
    return Guard(flags_[id], false, std::memory_order_release);
}

} // namespace locklab::locks
