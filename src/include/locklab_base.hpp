#pragma once
/**
 * @file locklab_base.hpp
 * @brief Layer 1: Basic modules built on locklab_platform.
 *
 * Provides format_tools, debug_info, the Logger, Result<T, E>, exponential Backoff and the
 * low-level synchronization primitives the lock algorithms share: ownership-transfer
 * traits, the AtomicOwned cell and the Waiter/Notifier handshake.
 * Include this when you need formatting, debug utilities, logging or the primitives.
 */
#include "locklab_platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"
#include "utils/backoff_strategy.hpp"
#include "utils/ownership_traits.hpp"
#include "utils/atomic_owned.hpp"
#include "utils/wait_notify.hpp"
