#include "locks/mcs_lock.hpp"

#include <utility>

namespace locklab::locks
{

McsLock::McsLock() : tail_(sync::Notifier<Successor>{})
{
    LOGGER_TRACE("McsLock created");
}

McsLock::Guard McsLock::acquire()
{
    auto [node, link] = sync::make_handshake<Successor>();
    sync::Notifier<Successor> predecessor = tail_.swap(std::move(link), std::memory_order_acq_rel);
    if (predecessor)
    {
        auto [wake_up, wake_up_signal] = sync::make_handshake<std::monostate>();
        *predecessor = std::move(wake_up_signal);
        predecessor.notify();
        (void)wake_up.wait();
    }
    return Guard(*this, std::move(node));
}

void McsLock::release(sync::Waiter<Successor> node) noexcept
{
    // On success the displaced value is our own link, and dropping it signals our node.
    // On failure a successor holds our link and signals the node once it has linked in.
    (void)tail_.compare_swap(node.raw(), sync::Notifier<Successor>{}, std::memory_order_acq_rel);

    Successor successor = std::move(node.wait());
    // successor is woken as it goes out of scope, before node is freed.
}

McsGuard::~McsGuard()
{
    release();
}

McsGuard::McsGuard(McsGuard &&other) noexcept
    : lock_(std::exchange(other.lock_, nullptr)), node_(std::move(other.node_))
{
}

McsGuard &McsGuard::operator=(McsGuard &&other) noexcept
{
    if (this != &other)
    {
        release();
        lock_ = std::exchange(other.lock_, nullptr);
        node_ = std::move(other.node_);
    }
    return *this;
}

void McsGuard::release() noexcept
{
    if (lock_ != nullptr)
    {
        std::exchange(lock_, nullptr)->release(std::move(node_));
    }
}

} // namespace locklab::locks
