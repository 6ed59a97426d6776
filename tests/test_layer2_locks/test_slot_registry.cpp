/**
 * @file test_slot_registry.cpp
 * @brief Tests for participant identity assignment in bounded locks.
 */
#include "locklab_locks.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <mutex>
#include <optional>
#include <set>
#include <vector>

using locklab::locks::SlotLease;
using locklab::locks::SlotRegistry;
using locklab::tests::helper::get_stress_iterations;
using locklab::tests::helper::get_stress_num_threads;
using locklab::tests::helper::ThreadRacer;

TEST(SlotRegistryTest, ClaimsUpToCapacity)
{
    SlotRegistry registry(3);
    EXPECT_EQ(registry.capacity(), 3u);
    EXPECT_EQ(registry.refs_left(), 3u);

    std::vector<SlotLease> leases;
    for (int i = 0; i < 3; ++i)
    {
        auto lease = registry.claim();
        ASSERT_TRUE(lease.has_value());
        EXPECT_EQ(lease->slot(), static_cast<size_t>(i)) << "lowest free slot first";
        leases.push_back(std::move(*lease));
    }
    EXPECT_EQ(registry.refs_left(), 0u);
    EXPECT_FALSE(registry.claim().has_value());
    EXPECT_EQ(registry.refs_left(), 0u) << "a refused claim must not consume capacity";
}

TEST(SlotRegistryTest, ReleasedSlot_IsReused)
{
    SlotRegistry registry(3);
    auto a = registry.claim();
    auto b = registry.claim();
    auto c = registry.claim();
    ASSERT_TRUE(a && b && c);

    b.reset(); // frees slot 1
    EXPECT_EQ(registry.refs_left(), 1u);
    auto d = registry.claim();
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->slot(), 1u);
    EXPECT_NE(d->slot(), a->slot());
    EXPECT_NE(d->slot(), c->slot());
}

TEST(SlotRegistryTest, MovedLease_ReleasesOnce)
{
    SlotRegistry registry(1);
    {
        auto lease = registry.claim();
        ASSERT_TRUE(lease.has_value());
        SlotLease moved = std::move(*lease);
        lease.reset(); // moved-from lease must not release
        EXPECT_EQ(registry.refs_left(), 0u);
    }
    EXPECT_EQ(registry.refs_left(), 1u);
}

TEST(SlotRegistryTest, ConcurrentClaims_NeverShareASlot)
{
    const int threads = get_stress_num_threads();
    const int iterations = get_stress_iterations(5000, 500);
    const size_t capacity = static_cast<size_t>(threads) - 1; // forces refusals

    SlotRegistry registry(capacity);
    std::vector<std::atomic<int>> holders(capacity);
    std::atomic<bool> shared_slot{false};
    std::atomic<int> refused{0};

    ThreadRacer racer(threads);
    ASSERT_TRUE(racer.race(
        [&](int)
        {
            for (int i = 0; i < iterations; ++i)
            {
                auto lease = registry.claim();
                if (!lease)
                {
                    refused.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                if (holders[lease->slot()].fetch_add(1) != 0)
                    shared_slot.store(true);
                holders[lease->slot()].fetch_sub(1);
            }
        }));

    EXPECT_FALSE(shared_slot.load());
    EXPECT_EQ(registry.refs_left(), capacity);
}

TEST(SlotRegistryDeathTest, ZeroCapacity_Panics)
{
    EXPECT_DEATH({ SlotRegistry registry(0); }, "capacity of at least one");
}
