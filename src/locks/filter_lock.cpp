#include "locks/filter_lock.hpp"

namespace locklab::locks
{

FilterLock::FilterLock(std::size_t capacity)
    : BoundedLockBase("FilterLock", capacity), size_(capacity),
      levels_(std::make_unique<std::atomic<std::size_t>[]>(capacity)),
      victims_(std::make_unique<std::atomic<std::size_t>[]>(capacity))
{
    LOGGER_DEBUG("FilterLock created for {} participants", capacity);
}

bool FilterLock::contended_at(std::size_t id, std::size_t level) const noexcept
{
    for (std::size_t k = 0; k < size_; ++k)
    {
        if (k != id && levels_[k].load(std::memory_order_acquire) >= level)
        {
            return true;
        }
    }
    return false;
}

FilterLock::Guard FilterLock::acquire_as(std::size_t id)
{
    for (std::size_t level = 1; level < size_; ++level)
    {
        levels_[id].store(level, std::memory_order_relaxed);
        victims_[level].exchange(id, std::memory_order_acq_rel);
        while (victims_[level].load(std::memory_order_acquire) == id && contended_at(id, level))
        {
            platform::cpu_relax();
        }
    }
    return Guard(levels_[id], 0, std::memory_order_release);
}

} // namespace locklab::locks
