#pragma once
/**
 * @file peterson_lock.hpp
 * @brief Peterson's two-participant lock.
 */
#include <array>
#include <atomic>
#include <cstddef>

#include "locks/guards.hpp"
#include "locks/lock.hpp"

namespace locklab::locks
{

/**
 * @class PetersonLock
 * @brief Mutual exclusion for at most two participants.
 *
 * Each participant raises its flag, then volunteers as the victim. It waits while the
 * other participant's flag is up and it is still the victim. The victim write is a single
 * acq_rel exchange; it orders the flag store before the other side's flag load. The wait
 * can end on either load, so both are acquire loads: each one synchronizes with the
 * previous holder.
 */
class LOCKLAB_EXPORT PetersonLock : public BoundedLockBase<PetersonLock>
{
  public:
    using Guard = FlagGuard;

    static constexpr std::size_t kMaxParticipants = 2;

    /**
     * @brief Creates the lock.
     * @param capacity Number of participants; must be 1 or 2, anything else panics.
     */
    explicit PetersonLock(std::size_t capacity = kMaxParticipants);

  private:
    friend class BoundedRef<PetersonLock>;

    Guard acquire_as(std::size_t id);

    std::array<std::atomic<bool>, kMaxParticipants> flags_{};
    std::atomic<std::size_t> victim_{0};
};

} // namespace locklab::locks
