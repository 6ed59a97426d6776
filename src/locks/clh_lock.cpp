#include "locks/clh_lock.hpp"

namespace locklab::locks
{

ClhLock::ClhLock() : tail_(sync::make_notified_waiter<std::monostate>())
{
    LOGGER_TRACE("ClhLock created");
}

ClhLock::Guard ClhLock::acquire()
{
    auto [mine, release] = sync::make_handshake<std::monostate>();
    sync::Waiter<std::monostate> predecessor =
        tail_.swap(std::move(mine), std::memory_order_acq_rel);
    (void)predecessor.wait();
    // predecessor's node is freed here; its holder let go of it when it signalled.
    return Guard(std::move(release));
}

} // namespace locklab::locks
