#pragma once
/**
 * @file mcs_lock.hpp
 * @brief MCS queue lock: an explicit queue where each holder hands off to its successor.
 */
#include <variant>

#include "locks/lock.hpp"
#include "utils/atomic_owned.hpp"
#include "utils/wait_notify.hpp"

namespace locklab::locks
{

class McsLock;

/**
 * @class McsGuard
 * @brief Held MCS lock. Releasing either empties the queue or wakes the successor.
 */
class LOCKLAB_EXPORT McsGuard
{
  public:
    /// Node payload: the successor's wake-up notifier, empty until a successor links in.
    using Successor = sync::Notifier<std::monostate>;

    McsGuard(McsLock &lock, sync::Waiter<Successor> node) noexcept
        : lock_(&lock), node_(std::move(node))
    {
    }
    ~McsGuard();

    McsGuard(McsGuard &&other) noexcept;
    McsGuard &operator=(McsGuard &&other) noexcept;
    McsGuard(const McsGuard &) = delete;
    McsGuard &operator=(const McsGuard &) = delete;

  private:
    void release() noexcept;

    McsLock *lock_;
    sync::Waiter<Successor> node_;
};

/**
 * @class McsLock
 * @brief Unbounded FIFO lock.
 *
 * The tail holds the notifying end of the last queued node, or an empty notifier when the
 * lock is free. An acquirer swaps in its own node. If there was a predecessor, it stores a
 * fresh wake-up notifier in the predecessor's node, signals that node ("successor linked")
 * and spins on its private wake-up flag.
 *
 * Release compare-and-swaps the tail from the holder's node back to empty. Success means
 * nobody queued behind; the holder gets its own notifier back and dropping it signals its
 * node. Either way the holder then waits on its node and drops the successor notifier
 * found there, which wakes the successor if one linked in.
 */
class LOCKLAB_EXPORT McsLock : public UnboundedLockBase<McsLock>
{
  public:
    using Guard = McsGuard;
    using Successor = McsGuard::Successor;

    McsLock();

    [[nodiscard]] Guard acquire();

    /// True while no thread holds or waits for the lock (racy snapshot).
    [[nodiscard]] bool is_free() const noexcept { return tail_identity() == nullptr; }

    /// Identity of the most recently queued node. Racy snapshot, for comparison only.
    [[nodiscard]] const void *tail_identity() const noexcept
    {
        return tail_.load_raw(std::memory_order_acquire);
    }

  private:
    friend class McsGuard;

    void release(sync::Waiter<Successor> node) noexcept;

    sync::AtomicOwned<sync::Notifier<Successor>> tail_;
};

} // namespace locklab::locks
