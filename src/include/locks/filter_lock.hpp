#pragma once
/**
 * @file filter_lock.hpp
 * @brief The filter lock: Peterson generalized to N participants.
 */
#include <atomic>
#include <cstddef>
#include <memory>

#include "locks/guards.hpp"
#include "locks/lock.hpp"

namespace locklab::locks
{

/**
 * @class FilterLock
 * @brief N-participant lock built from N-1 waiting levels.
 *
 * To pass level L a participant announces level L, makes itself the level's victim and
 * waits while it is still the victim and some other participant is at level L or above.
 * Each level holds back at least one contender, so one participant reaches level N-1.
 * Entry costs O(N) per level.
 */
class LOCKLAB_EXPORT FilterLock : public BoundedLockBase<FilterLock>
{
  public:
    using Guard = LevelGuard;

    /// @param capacity Number of participants, at least 1.
    explicit FilterLock(std::size_t capacity);

  private:
    friend class BoundedRef<FilterLock>;

    Guard acquire_as(std::size_t id);
    [[nodiscard]] bool contended_at(std::size_t id, std::size_t level) const noexcept;

    std::size_t size_;
    std::unique_ptr<std::atomic<std::size_t>[]> levels_;  // per participant, 0 = idle
    std::unique_ptr<std::atomic<std::size_t>[]> victims_; // per level
};

} // namespace locklab::locks
