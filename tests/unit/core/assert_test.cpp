// GpuBind Core Tests
// assert_test.cpp - Tests for always-on contract checks

#include <gtest/gtest.h>

#include <gpubind/core/assert.hpp>

namespace gpubind::core {
namespace {

int checked_divide(int a, int b) {
    GPUBIND_ASSERT(b != 0, "cannot divide {} by zero", a);
    return a / b;
}

TEST(AssertTest, PassingCheckHasNoEffect) {
    EXPECT_EQ(checked_divide(10, 2), 5);
}

TEST(AssertDeathTest, FailingCheckAbortsWithFormattedMessage) {
    EXPECT_DEATH((void)checked_divide(7, 0), "cannot divide 7 by zero");
}

TEST(AssertDeathTest, FailingCheckReportsCondition) {
    EXPECT_DEATH((void)checked_divide(1, 0), "b != 0");
}

TEST(AssertDeathTest, FatalAlwaysAborts) {
    EXPECT_DEATH(GPUBIND_FATAL("unrecoverable state {}", 42), "unrecoverable state 42");
}

}  // namespace
}  // namespace gpubind::core
