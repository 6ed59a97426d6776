/**
 * @file backoff_strategy.cpp
 * @brief Implements locklab::utils::Backoff.
 */
#include "utils/backoff_strategy.hpp"

#include <algorithm>
#include <thread>

namespace locklab::utils
{

namespace
{
std::uint_fast32_t seed_from_thread()
{
    std::random_device rd;
    return static_cast<std::uint_fast32_t>(rd()) ^
           static_cast<std::uint_fast32_t>(platform::get_native_thread_id());
}
} // namespace

Backoff::Backoff(BackoffConfig config)
    : min_(std::max(config.min_delay, std::chrono::nanoseconds(1))),
      max_(std::max(config.max_delay, min_)), limit_(min_), rng_(seed_from_thread())
{
}

std::chrono::nanoseconds Backoff::next_delay()
{
    std::uniform_int_distribution<std::int64_t> dist(0, limit_.count() - 1);
    const auto delay = std::chrono::nanoseconds(dist(rng_));
    limit_ = (limit_ > max_ / 2) ? max_ : limit_ * 2;
    return delay;
}

void Backoff::backoff()
{
    std::this_thread::sleep_for(next_delay());
}

} // namespace locklab::utils
