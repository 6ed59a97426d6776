#pragma once
/**
 * @file timeout_lock.hpp
 * @brief Queue lock whose acquire can give up after a deadline.
 */
#include <chrono>
#include <optional>

#include "locks/guards.hpp"
#include "locks/lock.hpp"
#include "utils/atomic_owned.hpp"
#include "utils/wait_notify.hpp"

namespace locklab::locks
{

/**
 * @brief Payload of a timeout-lock node, filled in when its owner signals.
 * @details Empty `rest` means the owner held the lock and released it. Otherwise the owner
 *          gave up while still queued, and `rest` is the part of the queue it was still
 *          waiting on; the successor takes it over.
 */
struct TimeoutLink
{
    sync::Waiter<TimeoutLink> rest;
};

/**
 * @class TimeoutLock
 * @brief Unbounded CLH-style lock supporting both blocking and deadline-bounded acquire.
 *
 * A waiter polls its predecessor without blocking. When the predecessor turns out to have
 * abandoned the queue, the waiter adopts the predecessor's own pending predecessor and
 * keeps polling, collapsing runs of abandoned nodes. A waiter that runs out of time hands
 * whatever it was still waiting on to its own successor, so every node is freed exactly
 * once and no holder's release is lost.
 */
class LOCKLAB_EXPORT TimeoutLock : public UnboundedLockBase<TimeoutLock>
{
  public:
    using Guard = HandoffGuard<TimeoutLink>;

    TimeoutLock();

    /// Spins until the lock is held.
    [[nodiscard]] Guard acquire();

    /**
     * @brief Tries to take the lock before `timeout` elapses.
     * @return The guard, or std::nullopt if the deadline passed first. Timing out is an
     *         expected outcome, not an error.
     */
    [[nodiscard]] std::optional<Guard> try_acquire(std::chrono::nanoseconds timeout);

    /// Identity of the most recently queued node. Racy snapshot, for comparison only.
    [[nodiscard]] const void *tail_identity() const noexcept
    {
        return tail_.load_raw(std::memory_order_acquire);
    }

  private:
    sync::AtomicOwned<sync::Waiter<TimeoutLink>> tail_;
};

} // namespace locklab::locks
