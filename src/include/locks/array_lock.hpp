#pragma once
/**
 * @file array_lock.hpp
 * @brief Anderson's array lock: FIFO admission through a ring of per-slot flags.
 */
#include <atomic>
#include <cstddef>
#include <memory>

#include "locks/lock.hpp"

namespace locklab::locks
{

class ArrayLock;

/**
 * @class ArrayGuard
 * @brief Releases an ArrayLock slot: clears it and raises the next one in the ring.
 */
class LOCKLAB_EXPORT ArrayGuard
{
  public:
    ArrayGuard(ArrayLock &lock, std::size_t slot) noexcept : lock_(&lock), slot_(slot) {}
    ~ArrayGuard();

    ArrayGuard(ArrayGuard &&other) noexcept;
    ArrayGuard &operator=(ArrayGuard &&other) noexcept;
    ArrayGuard(const ArrayGuard &) = delete;
    ArrayGuard &operator=(const ArrayGuard &) = delete;

    /// Ring position this holder was admitted through.
    [[nodiscard]] std::size_t slot() const noexcept { return slot_; }

  private:
    void release() noexcept;

    ArrayLock *lock_;
    std::size_t slot_;
};

/**
 * @class ArrayLock
 * @brief Bounded FIFO lock. Each acquirer takes the next ticket and spins on its own
 *        cache line until the previous holder raises it.
 *
 * The ring has one flag per participant, so no more than `capacity` threads may be queued,
 * which is what the bounded borrow enforces.
 */
class LOCKLAB_EXPORT ArrayLock : public BoundedLockBase<ArrayLock>
{
  public:
    using Guard = ArrayGuard;

    /// @param capacity Number of participants, at least 1.
    explicit ArrayLock(std::size_t capacity);

    /// Tickets handed out since construction.
    [[nodiscard]] std::size_t tickets_issued() const noexcept
    {
        return next_.load(std::memory_order_relaxed);
    }

  private:
    friend class BoundedRef<ArrayLock>;
    friend class ArrayGuard;

    struct alignas(platform::kCacheLineSize) PaddedFlag
    {
        std::atomic<bool> raised{false};
    };

    // Identity is not needed: the ticket decides the slot.
    Guard acquire_as(std::size_t id);
    void release(std::size_t slot) noexcept;

    std::size_t size_;
    std::unique_ptr<PaddedFlag[]> flags_;
    std::atomic<std::size_t> next_{0};
};

} // namespace locklab::locks
