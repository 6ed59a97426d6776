#include "locks/bakery_lock.hpp"

#include <algorithm>

namespace locklab::locks
{

BakeryLock::BakeryLock(std::size_t capacity)
    : BoundedLockBase("BakeryLock", capacity), size_(capacity),
      flags_(std::make_unique<std::atomic<bool>[]>(capacity)),
      labels_(std::make_unique<std::atomic<std::uint64_t>[]>(capacity))
{
    LOGGER_DEBUG("BakeryLock created for {} participants", capacity);
}

bool BakeryLock::waits_for(std::size_t k, const Ticket &mine) const noexcept
{
    return flags_[k].load(std::memory_order_seq_cst) &&
           precedes(Ticket{labels_[k].load(std::memory_order_seq_cst), k}, mine);
}

void BakeryLock::raise_flag(std::size_t id) noexcept
{
    flags_[id].store(true, std::memory_order_seq_cst);
}

void BakeryLock::publish(const Ticket &ticket) noexcept
{
    labels_[ticket.id].store(ticket.label, std::memory_order_seq_cst);
}

std::uint64_t BakeryLock::highest_label() const noexcept
{
    std::uint64_t highest = 0;
    for (std::size_t k = 0; k < size_; ++k)
    {
        highest = std::max(highest, labels_[k].load(std::memory_order_seq_cst));
    }
    return highest;
}

BakeryLock::Guard BakeryLock::wait_turn(const Ticket &mine)
{
    for (std::size_t k = 0; k < size_; ++k)
    {
        if (k == mine.id)
            continue;
        while (waits_for(k, mine))
        {
            platform::cpu_relax();
        }
    }
    return Guard(flags_[mine.id], false, std::memory_order_seq_cst);
}

BakeryLock::Guard BakeryLock::acquire_as(std::size_t id)
{
    raise_flag(id);
    const Ticket mine{highest_label() + 1, id};
    publish(mine);
    return wait_turn(mine);
}

} // namespace locklab::locks
