#include "locks/array_lock.hpp"

#include <utility>

namespace locklab::locks
{

ArrayLock::ArrayLock(std::size_t capacity)
    : BoundedLockBase("ArrayLock", capacity), size_(capacity),
      flags_(std::make_unique<PaddedFlag[]>(capacity))
{
    flags_[0].raised.store(true, std::memory_order_relaxed);
    LOGGER_DEBUG("ArrayLock created for {} participants", capacity);
}

ArrayLock::Guard ArrayLock::acquire_as(std::size_t /*id*/)
{
    const std::size_t slot = next_.fetch_add(1, std::memory_order_acq_rel) % size_;
    while (!flags_[slot].raised.load(std::memory_order_acquire))
    {
        platform::cpu_relax();
    }
    return Guard(*this, slot);
}

void ArrayLock::release(std::size_t slot) noexcept
{
    flags_[slot].raised.store(false, std::memory_order_relaxed);
    flags_[(slot + 1) % size_].raised.store(true, std::memory_order_release);
}

ArrayGuard::~ArrayGuard()
{
    release();
}

ArrayGuard::ArrayGuard(ArrayGuard &&other) noexcept
    : lock_(std::exchange(other.lock_, nullptr)), slot_(other.slot_)
{
}

ArrayGuard &ArrayGuard::operator=(ArrayGuard &&other) noexcept
{
    if (this != &other)
    {
        release();
        lock_ = std::exchange(other.lock_, nullptr);
        slot_ = other.slot_;
    }
    return *this;
}

void ArrayGuard::release() noexcept
{
    if (lock_ != nullptr)
    {
        std::exchange(lock_, nullptr)->release(slot_);
    }
}

} // namespace locklab::locks
