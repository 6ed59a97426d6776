#include "locks/slot_registry.hpp"
#include "utils/debug_info.hpp"

#include <algorithm>
#include <utility>

namespace locklab::locks
{

SlotRegistry::SlotRegistry(std::size_t capacity)
    : capacity_(capacity), refs_left_(static_cast<std::ptrdiff_t>(capacity)),
      taken_(std::make_unique<std::atomic<bool>[]>(capacity))
{
    if (capacity == 0)
    {
        LOCKLAB_PANIC("a bounded lock needs a capacity of at least one participant");
    }
}

std::optional<SlotLease> SlotRegistry::claim() noexcept
{
    if (refs_left_.fetch_sub(1, std::memory_order_acq_rel) <= 0)
    {
        refs_left_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    // Admission guarantees a free slot exists, but a single pass can race with leases
    // being returned and re-claimed behind it.
    for (;;)
    {
        for (std::size_t i = 0; i < capacity_; ++i)
        {
            bool expected = false;
            if (!taken_[i].load(std::memory_order_relaxed) &&
                taken_[i].compare_exchange_strong(expected, true, std::memory_order_acquire,
                                                  std::memory_order_relaxed))
            {
                return SlotLease(this, i);
            }
        }
        platform::cpu_relax();
    }
}

std::size_t SlotRegistry::refs_left() const noexcept
{
    return static_cast<std::size_t>(
        std::max<std::ptrdiff_t>(0, refs_left_.load(std::memory_order_acquire)));
}

void SlotRegistry::release(std::size_t slot) noexcept
{
    // The slot must be free again before the admission it backs is returned.
    taken_[slot].store(false, std::memory_order_release);
    refs_left_.fetch_add(1, std::memory_order_acq_rel);
}

SlotLease::~SlotLease()
{
    if (registry_ != nullptr)
    {
        registry_->release(slot_);
    }
}

SlotLease::SlotLease(SlotLease &&other) noexcept
    : registry_(std::exchange(other.registry_, nullptr)), slot_(other.slot_)
{
}

SlotLease &SlotLease::operator=(SlotLease &&other) noexcept
{
    if (this != &other)
    {
        if (registry_ != nullptr)
        {
            registry_->release(slot_);
        }
        registry_ = std::exchange(other.registry_, nullptr);
        slot_ = other.slot_;
    }
    return *this;
}

} // namespace locklab::locks
