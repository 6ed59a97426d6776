#pragma once
/**
 * @file bakery_lock.hpp
 * @brief Lamport's bakery lock.
 */
#include <atomic>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "locks/guards.hpp"
#include "locks/lock.hpp"

namespace locklab::locks
{

/**
 * @class BakeryLock
 * @brief N-participant lock ordered by tickets.
 *
 * A participant raises its flag, takes a label one above the largest it can see and waits
 * until no other flagged participant holds an earlier ticket. Tickets compare by label,
 * then by identity, so equal labels resolve in favour of the lower identity.
 *
 * Every flag and label access is sequentially consistent. With release/acquire alone a
 * competitor can observe a new label without the raised flag that preceded it (or the
 * reverse), and two participants may then both decide they hold the earliest ticket.
 */
class LOCKLAB_EXPORT BakeryLock : public BoundedLockBase<BakeryLock>
{
  public:
    using Guard = FlagGuard;

    struct Ticket
    {
        std::uint64_t label;
        std::size_t id;

        friend constexpr auto operator<=>(const Ticket &, const Ticket &) = default;
    };

    /// @param capacity Number of participants, at least 1.
    explicit BakeryLock(std::size_t capacity);

    /// True when ticket `a` is served before ticket `b`.
    [[nodiscard]] static constexpr bool precedes(const Ticket &a, const Ticket &b) noexcept
    {
        return a < b;
    }

  protected:
    // The steps of acquire_as, exposed so tests can stage two participants holding the
    // same label and then let them contend.
    void raise_flag(std::size_t id) noexcept;
    void publish(const Ticket &ticket) noexcept;
    /// Spins until no other flagged participant holds a ticket that precedes `mine`.
    Guard wait_turn(const Ticket &mine);

  private:
    friend class BoundedRef<BakeryLock>;

    Guard acquire_as(std::size_t id);
    [[nodiscard]] std::uint64_t highest_label() const noexcept;
    [[nodiscard]] bool waits_for(std::size_t k, const Ticket &mine) const noexcept;

    std::size_t size_;
    std::unique_ptr<std::atomic<bool>[]> flags_;
    std::unique_ptr<std::atomic<std::uint64_t>[]> labels_;
};

} // namespace locklab::locks
