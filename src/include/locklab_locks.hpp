#pragma once
/**
 * @file locklab_locks.hpp
 * @brief Layer 2: Mutual-exclusion algorithms built on locklab_base.
 *
 * Bounded locks (fixed participant count, one identity per borrowed reference):
 * PetersonLock, FilterLock, BakeryLock, ArrayLock.
 * Unbounded locks (any number of participants): TasLock, TtasLock, BackoffLock, ClhLock,
 * McsLock, TimeoutLock.
 *
 * Every lock is used the same way: borrow a reference, acquire a guard through it, and
 * let the guard go out of scope to release.
 * @code
 * locklab::locks::FilterLock lock(4);
 * auto ref = lock.borrow();           // Result<Ref, BorrowError>
 * if (ref.is_ok()) {
 *     auto guard = ref.content().acquire();
 *     // critical section
 * }
 * @endcode
 */
#include "locklab_base.hpp"

#include "locks/lock.hpp"
#include "locks/slot_registry.hpp"
#include "locks/guards.hpp"
#include "locks/peterson_lock.hpp"
#include "locks/filter_lock.hpp"
#include "locks/bakery_lock.hpp"
#include "locks/tas_lock.hpp"
#include "locks/ttas_lock.hpp"
#include "locks/array_lock.hpp"
#include "locks/clh_lock.hpp"
#include "locks/mcs_lock.hpp"
#include "locks/timeout_lock.hpp"
