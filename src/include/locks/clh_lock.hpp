#pragma once
/**
 * @file clh_lock.hpp
 * @brief CLH queue lock: an implicit queue where each thread spins on its predecessor's node.
 */
#include <variant>

#include "locks/guards.hpp"
#include "locks/lock.hpp"
#include "utils/atomic_owned.hpp"
#include "utils/wait_notify.hpp"

namespace locklab::locks
{

/**
 * @class ClhLock
 * @brief Unbounded FIFO lock.
 *
 * The tail holds the waiting end of the most recently queued node. An acquirer swaps its
 * own fresh node into the tail, waits on the node it displaced and then frees it. Its
 * guard keeps the notifying end of its own node; releasing signals whoever queued behind,
 * or leaves the node signalled in the tail for the next arrival.
 */
class LOCKLAB_EXPORT ClhLock : public UnboundedLockBase<ClhLock>
{
  public:
    using Guard = HandoffGuard<std::monostate>;

    ClhLock();

    [[nodiscard]] Guard acquire();

    /// Identity of the most recently queued node. Racy snapshot, for comparison only.
    [[nodiscard]] const void *tail_identity() const noexcept
    {
        return tail_.load_raw(std::memory_order_acquire);
    }

  private:
    // Seeded with an already-signalled node so the first acquirer passes straight through.
    sync::AtomicOwned<sync::Waiter<std::monostate>> tail_;
};

} // namespace locklab::locks
