#pragma once
/**
 * @file slot_registry.hpp
 * @brief Participant identities for bounded locks.
 *
 * A bounded lock admits at most `capacity` references at a time and gives each one a
 * distinct identity in `[0, capacity)`. Admission is counted with `refs_left`; once a
 * borrow is admitted it claims the lowest free slot with a compare-and-swap. Identities
 * stay unique however references are dropped and re-borrowed.
 */
#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>

#include "locklab_platform.hpp"

namespace locklab::locks
{

class SlotLease;

class LOCKLAB_EXPORT SlotRegistry
{
  public:
    /**
     * @brief Creates a registry with `capacity` slots.
     * @details A capacity of zero is a programming error and panics.
     */
    explicit SlotRegistry(std::size_t capacity);

    SlotRegistry(const SlotRegistry &) = delete;
    SlotRegistry &operator=(const SlotRegistry &) = delete;

    /**
     * @brief Admits one more participant and assigns it a slot.
     * @return The lease, or std::nullopt when every slot is in use.
     */
    [[nodiscard]] std::optional<SlotLease> claim() noexcept;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Number of further borrows that would currently be admitted (never negative).
    [[nodiscard]] std::size_t refs_left() const noexcept;

  private:
    friend class SlotLease;
    void release(std::size_t slot) noexcept;

    std::size_t capacity_;
    std::atomic<std::ptrdiff_t> refs_left_;
    std::unique_ptr<std::atomic<bool>[]> taken_;
};

/**
 * @class SlotLease
 * @brief Move-only ownership of one registry slot; returns it on destruction.
 */
class LOCKLAB_EXPORT SlotLease
{
  public:
    ~SlotLease();

    SlotLease(const SlotLease &) = delete;
    SlotLease &operator=(const SlotLease &) = delete;
    SlotLease(SlotLease &&other) noexcept;
    SlotLease &operator=(SlotLease &&other) noexcept;

    [[nodiscard]] std::size_t slot() const noexcept { return slot_; }

  private:
    friend class SlotRegistry;
    SlotLease(SlotRegistry *registry, std::size_t slot) noexcept
        : registry_(registry), slot_(slot)
    {
    }

    SlotRegistry *registry_;
    std::size_t slot_;
};

} // namespace locklab::locks
