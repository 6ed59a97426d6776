/**
 * @file test_result.cpp
 * @brief Tests for Result<T, E> and BorrowError.
 */
#include "locklab_base.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using locklab::utils::BorrowError;
using locklab::utils::Result;

TEST(ResultTest, Ok_HoldsContent)
{
    auto r = Result<std::string, BorrowError>::ok("ticket");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), "ticket");
    EXPECT_EQ(r.value_or("other"), "ticket");
    EXPECT_THROW((void)r.error(), std::logic_error);
    EXPECT_THROW((void)r.error_code(), std::logic_error);
}

TEST(ResultTest, Error_HoldsErrorAndCode)
{
    auto r = Result<int, BorrowError>::error(BorrowError::ThreadCapacityExceeded, 7);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), BorrowError::ThreadCapacityExceeded);
    EXPECT_EQ(r.error_code(), 7);
    EXPECT_EQ(r.value_or(-1), -1);
    EXPECT_THROW((void)r.content(), std::logic_error);
}

TEST(ResultTest, MoveOnlyContent_CanBeMovedOut)
{
    auto r = Result<std::unique_ptr<int>, BorrowError>::ok(std::make_unique<int>(5));
    ASSERT_TRUE(r.is_ok());
    std::unique_ptr<int> p = std::move(r).content();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 5);

    auto moved = std::move(r);
    EXPECT_TRUE(moved.is_ok());
}

TEST(ResultTest, BorrowError_ToString)
{
    EXPECT_STREQ(locklab::utils::to_string(BorrowError::ThreadCapacityExceeded),
                 "ThreadCapacityExceeded");
}
