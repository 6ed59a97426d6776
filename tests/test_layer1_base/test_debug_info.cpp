/**
 * @file test_debug_info.cpp
 * @brief Tests for panic, debug messages and stack trace printing.
 */
#include "locklab_base.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

using locklab::tests::helper::StringCapture;

namespace
{
[[noreturn]] void function_that_panics(int code)
{
    LOCKLAB_PANIC("unrecoverable state {}", code);
}
} // namespace

TEST(DebugInfoTest, Panic_PrintsLocationAndAborts)
{
    // EXPECT_DEATH runs the statement in a new process and checks its exit status and stderr.
    EXPECT_DEATH(function_that_panics(42),
                 "\\[PANIC\\] test_debug_info\\.cpp:[0-9]+:.*unrecoverable state 42");
}

TEST(DebugInfoTest, Panic_PrintsStackTrace)
{
    EXPECT_DEATH(function_that_panics(1), "Stack Trace");
}

TEST(DebugInfoTest, DebugMsg_WritesToStderr)
{
    StringCapture capture(STDERR_FILENO);
    LOCKLAB_DEBUG("slot {} of {}", 3, 8);
    const std::string out = capture.GetOutput();
    EXPECT_NE(out.find("[DBG]  slot 3 of 8"), std::string::npos) << out;
}

TEST(DebugInfoTest, PrintStackTrace_ListsFrames)
{
    StringCapture capture(STDERR_FILENO);
    locklab::debug::print_stack_trace();
    const std::string out = capture.GetOutput();
    EXPECT_NE(out.find("Stack Trace (most recent call first):"), std::string::npos);
    EXPECT_NE(out.find("#00"), std::string::npos) << out;
}
