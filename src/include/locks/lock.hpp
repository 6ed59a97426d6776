#pragma once
/**
 * @file lock.hpp
 * @brief The lock abstraction: borrowing references and acquiring guards.
 *
 * A participant never acquires a lock directly. It first borrows a reference:
 *  - Bounded locks (`BoundedLockBase`) admit a fixed number of references. Each carries a
 *    participant identity in `[0, capacity)`; borrowing past the capacity fails with
 *    `BorrowError::ThreadCapacityExceeded`.
 *  - Unbounded locks (`UnboundedLockBase`) hand out any number of identity-free references.
 *
 * `Ref::acquire()` spins until mutual exclusion is granted and returns the lock's `Guard`.
 * Destroying the guard runs the algorithm's release protocol exactly once. Guards are
 * move-only. Bounded locks keep their acquire entry point private to `BoundedRef`, so an
 * identity is only ever used by the reference that leased it.
 */
#include <concepts>
#include <cstddef>
#include <utility>

#include "locks/slot_registry.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"

namespace locklab::locks
{

/**
 * @class BoundedRef
 * @brief A participant's reference to a bounded lock, carrying its identity.
 *
 * Returning the reference (destroying it) frees the identity for the next borrower.
 */
template <typename L> class BoundedRef
{
  public:
    BoundedRef(L &lock, SlotLease lease) noexcept : lock_(&lock), lease_(std::move(lease)) {}

    BoundedRef(BoundedRef &&) noexcept = default;
    BoundedRef &operator=(BoundedRef &&) noexcept = default;
    BoundedRef(const BoundedRef &) = delete;
    BoundedRef &operator=(const BoundedRef &) = delete;

    /// Spins until this participant holds the lock.
    [[nodiscard]] auto acquire() { return lock_->acquire_as(lease_.slot()); }

    /// Participant identity within the lock, in `[0, capacity)`.
    [[nodiscard]] std::size_t id() const noexcept { return lease_.slot(); }

  private:
    L *lock_;
    SlotLease lease_;
};

/**
 * @class UnboundedRef
 * @brief A reference to an unbounded lock. Carries no identity.
 */
template <typename L> class UnboundedRef
{
  public:
    explicit UnboundedRef(L &lock) noexcept : lock_(&lock) {}

    [[nodiscard]] auto acquire() { return lock_->acquire(); }

    /// Forwards to the lock's non-blocking or deadline-bounded acquire, where it has one.
    template <typename... Args>
    [[nodiscard]] auto try_acquire(Args &&...args)
        requires requires(L &l) { l.try_acquire(std::declval<Args>()...); }
    {
        return lock_->try_acquire(std::forward<Args>(args)...);
    }

  private:
    L *lock_;
};

/**
 * @class BoundedLockBase
 * @brief Reference accounting shared by the bounded algorithms.
 *
 * `Derived` provides a private `Guard acquire_as(std::size_t id)` and befriends
 * `BoundedRef<Derived>`.
 */
template <typename Derived> class BoundedLockBase
{
  public:
    using Ref = BoundedRef<Derived>;

    BoundedLockBase(const BoundedLockBase &) = delete;
    BoundedLockBase &operator=(const BoundedLockBase &) = delete;
    BoundedLockBase(BoundedLockBase &&) = delete;
    BoundedLockBase &operator=(BoundedLockBase &&) = delete;

    /**
     * @brief Borrows a reference with a fresh participant identity.
     * @return The reference, or `BorrowError::ThreadCapacityExceeded` while `capacity()`
     *         references are outstanding.
     */
    [[nodiscard]] utils::BorrowResult<Ref> borrow()
    {
        auto lease = registry_.claim();
        if (!lease)
        {
            LOGGER_DEBUG("{}: borrow refused, all {} participant slots are in use", name_,
                         registry_.capacity());
            return utils::BorrowResult<Ref>::error(utils::BorrowError::ThreadCapacityExceeded);
        }
        return utils::BorrowResult<Ref>::ok(Ref(static_cast<Derived &>(*this), std::move(*lease)));
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return registry_.capacity(); }
    [[nodiscard]] std::size_t refs_left() const noexcept { return registry_.refs_left(); }

  protected:
    BoundedLockBase(const char *name, std::size_t capacity) : name_(name), registry_(capacity) {}
    ~BoundedLockBase() = default;

  private:
    const char *name_;
    SlotRegistry registry_;
};

/**
 * @class UnboundedLockBase
 * @brief `borrow()` for the unbounded algorithms; it always succeeds.
 *
 * `Derived` provides `Guard acquire()`.
 */
template <typename Derived> class UnboundedLockBase
{
  public:
    using Ref = UnboundedRef<Derived>;

    UnboundedLockBase(const UnboundedLockBase &) = delete;
    UnboundedLockBase &operator=(const UnboundedLockBase &) = delete;
    UnboundedLockBase(UnboundedLockBase &&) = delete;
    UnboundedLockBase &operator=(UnboundedLockBase &&) = delete;

    [[nodiscard]] utils::BorrowResult<Ref> borrow()
    {
        return utils::BorrowResult<Ref>::ok(Ref(static_cast<Derived &>(*this)));
    }

  protected:
    UnboundedLockBase() = default;
    ~UnboundedLockBase() = default;
};

/// A lock: hands out references whose `acquire()` yields the lock's guard type.
template <typename L>
concept Lock = requires(L &lock) {
    typename L::Ref;
    typename L::Guard;
    { lock.borrow() } -> std::same_as<utils::BorrowResult<typename L::Ref>>;
    { std::declval<typename L::Ref &>().acquire() } -> std::same_as<typename L::Guard>;
};

template <typename L>
concept BoundedLock = Lock<L> && std::derived_from<L, BoundedLockBase<L>>;

template <typename L>
concept UnboundedLock = Lock<L> && std::derived_from<L, UnboundedLockBase<L>>;

} // namespace locklab::locks
